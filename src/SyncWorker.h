/**
 * @file SyncWorker.h
 * @brief Background loop driving the asset sync protocol
 *
 * One worker per connection. run() performs the bootstrap handshake
 * (info package), then serves the request queue one item at a time:
 * command out, response in, result materialized under the cache root,
 * signal posted. Stops when asked to, on END_SESSION, or when the
 * connection fails (posting CONNECTION_LOST).
 */

#ifndef ASSETSYNC_SYNC_WORKER_H
#define ASSETSYNC_SYNC_WORKER_H

#include "SyncMessages.h"
#include "SyncQueue.h"
#include "Transport.h"

#include <atomic>
#include <string>

struct Config;
class ContentCache;
class SessionHooks;

class SyncWorker {
public:
    SyncWorker(Transport& transport, ContentCache& cache,
               SyncQueue<Request>& requests, SyncQueue<Signal>& signals,
               SessionHooks& hooks, const Config& config);

    // Non-copyable
    SyncWorker(const SyncWorker&) = delete;
    SyncWorker& operator=(const SyncWorker&) = delete;

    // Bootstrap + request loop (blocks - call from the worker thread)
    void run();

    // Cooperative cancellation, observed between items (thread-safe).
    // Queued requests stay queued.
    void requestStop();

    // Finish at an END_SESSION queued behind everything pending. Until then
    // queued fetches are skipped, score notices are still sent.
    void requestEndSession();

    bool isRunning() const { return m_running.load(std::memory_order_acquire); }

    // Items completed / failed since construction
    uint64_t getCompletedCount() const { return m_completed.load(std::memory_order_relaxed); }
    uint64_t getFailedCount() const { return m_failed.load(std::memory_order_relaxed); }

private:
    Transport& m_transport;
    ContentCache& m_cache;
    SyncQueue<Request>& m_requests;
    SyncQueue<Signal>& m_signals;
    SessionHooks& m_hooks;
    const Config& m_config;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_ending{false};
    std::atomic<uint64_t> m_completed{0};
    std::atomic<uint64_t> m_failed{0};

    // Handlers return false when the connection is gone
    bool fetchInfoPackage();
    bool dispatch(const Request& request);
    bool fetchSong(const Request& request);
    bool fetchAlbumCover(const Request& request);
    bool uploadScores(const Request& request);

    // Post failure signals; returns whether the connection survived
    bool reportFailure(IoStatus status, RequestType source,
                       const std::string& id, const std::string& what);
    void reportConnectionLost(const std::string& why);
};

#endif // ASSETSYNC_SYNC_WORKER_H
