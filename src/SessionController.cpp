/**
 * @file SessionController.cpp
 * @brief Session lifecycle and disconnect handshake
 */

#include "SessionController.h"
#include "ContentAddress.h"
#include "SyncWorker.h"
#include "ZipArchive.h"
#include "LogLevel.h"

#include <chrono>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

// ============================================
// Constructor / Destructor
// ============================================

SessionController::SessionController(std::shared_ptr<SessionHooks> hooks)
    : m_hooks(hooks ? std::move(hooks) : std::make_shared<SessionHooks>())
{
}

SessionController::~SessionController() {
    stop();
}

// ============================================
// Lifecycle
// ============================================

bool SessionController::start(const Config& config) {
    if (isStarted()) {
        LOG_WARN("[Session] Already started");
        return false;
    }

    m_config = config;
    if (m_config.cacheRoot.empty()) {
        m_config.cacheRoot = defaultCacheRoot();
    }

    m_transport.setReadTimeout(m_config.transferTimeoutMs);
    m_transport.setMaxFrameBytes(m_config.maxFrameBytes);
    if (!m_transport.connect(m_config.server, m_config.port)) {
        return false;
    }

    // Nothing from a previous run is trusted
    m_cache.setRoot(m_config.cacheRoot);
    if (!m_cache.prepare()) {
        m_transport.disconnect();
        return false;
    }

    m_requests.clear();
    m_signals.clear();
    m_started.store(true, std::memory_order_release);

    startWorker();
    LOG_INFO("Session started (cache: " << m_cache.root() << ")");
    return true;
}

void SessionController::stop() {
    if (!m_started.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    LOG_INFO("Ending session...");
    // Score notices queued before the stop still go out ahead of the handshake
    joinWorker(true);

    if (m_transport.isConnected()) {
        endSession();
    } else {
        LOG_WARN("[Session] Not connected, score upload skipped");
    }

    m_transport.disconnect();
    m_requests.clear();
    m_cache.destroy();
    LOG_INFO("Session closed");
}

bool SessionController::reconnect() {
    if (!isStarted()) {
        LOG_WARN("[Session] reconnect() without an active session");
        return false;
    }

    if (m_worker && m_worker->isRunning()) {
        LOG_WARN("[Session] Worker still running, dropping current connection");
    }
    joinWorker(false);
    m_transport.disconnect();

    if (!m_transport.connect(m_config.server, m_config.port)) {
        return false;
    }

    startWorker();
    LOG_INFO("Reconnected (" << m_requests.size() << " requests pending)");
    return true;
}

void SessionController::startWorker() {
    m_worker = std::make_unique<SyncWorker>(m_transport, m_cache, m_requests, m_signals,
                                            *m_hooks, m_config);
    SyncWorker* worker = m_worker.get();
    m_workerThread = std::thread([worker]() {
        worker->run();
    });
}

void SessionController::joinWorker(bool endSession) {
    if (m_worker) {
        if (endSession) {
            m_worker->requestEndSession();
        } else {
            m_worker->requestStop();
        }
    }
    if (m_workerThread.joinable()) {
        m_workerThread.join();
    }
    if (m_worker) {
        LOG_DEBUG("[Session] Worker joined (" << m_worker->getCompletedCount() << " completed, "
                  << m_worker->getFailedCount() << " failed, "
                  << m_transport.getBytesReceived() << " bytes received)");
    }
    m_worker.reset();
}

// ============================================
// Caller Interface
// ============================================

void SessionController::checkForSignals() {
    // Only what is queued now: a callback that re-requests a cached item
    // posts a new signal that waits for the next call
    size_t available = m_signals.size();
    Signal signal;
    while (available-- > 0 && m_signals.tryPop(signal)) {
        if (m_signalCb) {
            m_signalCb(signal);
        }
    }
}

void SessionController::requestDownload(const std::string& path) {
    if (!isStarted()) {
        LOG_WARN("[Session] Download requested without a session: " << path);
        return;
    }

    std::string id = contentAddress(path);
    if (m_cache.hasSong(id)) {
        m_signals.push(Signal::downloadComplete(id));
        return;
    }
    m_requests.push(Request::fetchSong(path));
}

void SessionController::requestAlbumCover(const std::string& path) {
    if (!isStarted()) {
        LOG_WARN("[Session] Album cover requested without a session: " << path);
        return;
    }

    std::string id = contentAddress(path);
    if (m_cache.hasAlbumCover(id)) {
        m_signals.push(Signal::albumCoverComplete(id));
        return;
    }
    m_requests.push(Request::fetchAlbumCover(path));
}

void SessionController::writeScores() {
    if (!isStarted()) {
        LOG_WARN("[Session] writeScores() without a session");
        return;
    }
    m_requests.push(Request::uploadScores());
}

// ============================================
// Disconnect Handshake
// ============================================

void SessionController::endSession() {
    if (m_transport.sendText(Request::endSession().toWire()) != IoStatus::OK) {
        LOG_WARN("[Session] Could not send end of session");
        return;
    }

    if (!waitForEndAck()) {
        return;
    }
    sendScoreArchive();
}

bool SessionController::waitForEndAck() {
    // The ack is matched against each read as a whole. A split or coalesced
    // ack is not recognized and the wait runs into the timeout.
    const auto started = std::chrono::steady_clock::now();
    const auto limit = std::chrono::milliseconds(m_config.ackTimeoutMs);

    while (true) {
        std::string message;
        IoStatus st = m_transport.receiveText(message, m_config.pollIntervalMs);
        if (st == IoStatus::OK) {
            if (message == ACK_END_SESSION) {
                LOG_DEBUG("[Session] End of session acknowledged");
                return true;
            }
            LOG_DEBUG("[Session] Discarding " << message.size()
                      << " bytes while waiting for the end of session ack");
        } else if (st != IoStatus::TIMEOUT) {
            LOG_WARN("[Session] Connection lost before end of session ack ("
                     << ioStatusName(st) << ")");
            return false;
        }

        if (m_config.ackTimeoutMs > 0 && std::chrono::steady_clock::now() - started >= limit) {
            LOG_WARN("[Session] No end of session ack after " << m_config.ackTimeoutMs
                     << "ms, score upload skipped");
            return false;
        }
    }
}

void SessionController::sendScoreArchive() {
    std::string archive = m_cache.tempArchivePath();
    std::string scorePath = m_cache.pathFor(m_config.scoreFile);

    std::vector<ZipSource> sources;
    std::error_code ec;
    if (fs::is_regular_file(scorePath, ec)) {
        sources.push_back({scorePath, fs::path(m_config.scoreFile).filename().string()});
    } else {
        LOG_WARN("[Session] No score file at " << scorePath << ", uploading an empty archive");
    }

    IoStatus st;
    if (createZip(archive, sources)) {
        st = m_transport.sendFramedFile(archive);
    } else {
        // The server is waiting for a frame either way
        LOG_ERROR("[Session] Score archive could not be built, sending an empty frame");
        st = m_transport.sendFramed(nullptr, 0);
    }
    m_cache.discard(archive);

    if (st != IoStatus::OK) {
        LOG_WARN("[Session] Score upload failed: " << ioStatusName(st));
        return;
    }
    LOG_INFO("Scores uploaded");
}
