/**
 * @file SessionController.h
 * @brief Caller-facing session: connect, sync, disconnect handshake, teardown
 *
 * The caller thread only touches the two queues and, for the dedup check,
 * the file system. All network I/O happens on the worker thread, or in
 * stop() once the worker has been joined.
 *
 *   start()  -> connect, fresh cache root, worker thread (bootstrap + loop)
 *   request*() / writeScores()  -> request queue
 *   checkForSignals()  -> drains the signal channel on the caller thread
 *   stop()   -> worker sends queued score notices, skips queued fetches
 *               and exits; then EndSession/ack/score upload, close,
 *               delete cache root
 */

#ifndef ASSETSYNC_SESSION_CONTROLLER_H
#define ASSETSYNC_SESSION_CONTROLLER_H

#include "Config.h"
#include "ContentCache.h"
#include "SessionHooks.h"
#include "SyncMessages.h"
#include "SyncQueue.h"
#include "Transport.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

class SyncWorker;

class SessionController {
public:
    using SignalCallback = std::function<void(const Signal& signal)>;

    explicit SessionController(std::shared_ptr<SessionHooks> hooks = nullptr);
    ~SessionController();

    // Non-copyable
    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Lifecycle
    bool start(const Config& config);
    void stop();

    // Drop the current connection (if any) and start over with the same
    // cache root and the still-queued requests. Caller-driven only.
    bool reconnect();

    bool isStarted() const { return m_started.load(std::memory_order_acquire); }
    bool isConnected() const { return m_transport.isConnected(); }

    // Register the signal callback (invoked from checkForSignals() only)
    void onSignal(SignalCallback cb) { m_signalCb = std::move(cb); }

    // Deliver every signal queued so far, in order, on the calling thread
    void checkForSignals();

    // Non-blocking requests (any thread)
    void requestDownload(const std::string& path);
    void requestAlbumCover(const std::string& path);
    void writeScores();

    const ContentCache& cache() const { return m_cache; }
    size_t pendingRequests() const { return m_requests.size(); }

private:
    Config m_config;
    Transport m_transport;
    ContentCache m_cache;
    SyncQueue<Request> m_requests;
    SyncQueue<Signal> m_signals;
    std::shared_ptr<SessionHooks> m_hooks;

    std::unique_ptr<SyncWorker> m_worker;
    std::thread m_workerThread;
    std::atomic<bool> m_started{false};

    SignalCallback m_signalCb;

    void startWorker();
    // endSession: let the worker drain up to an END_SESSION; otherwise stop it now
    void joinWorker(bool endSession);

    // Disconnect handshake (worker must be joined)
    void endSession();
    bool waitForEndAck();
    void sendScoreArchive();
};

#endif // ASSETSYNC_SESSION_CONTROLLER_H
