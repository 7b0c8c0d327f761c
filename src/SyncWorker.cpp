/**
 * @file SyncWorker.cpp
 * @brief Background protocol loop implementation
 */

#include "SyncWorker.h"
#include "Config.h"
#include "ContentAddress.h"
#include "ContentCache.h"
#include "SessionHooks.h"
#include "ZipArchive.h"
#include "LogLevel.h"

#include <chrono>

SyncWorker::SyncWorker(Transport& transport, ContentCache& cache,
                       SyncQueue<Request>& requests, SyncQueue<Signal>& signals,
                       SessionHooks& hooks, const Config& config)
    : m_transport(transport)
    , m_cache(cache)
    , m_requests(requests)
    , m_signals(signals)
    , m_hooks(hooks)
    , m_config(config)
{
}

// ============================================
// Main Loop
// ============================================

void SyncWorker::run() {
    m_running.store(true, std::memory_order_release);
    LOG_DEBUG("[Worker] Started");

    if (!dispatch(Request::fetchInfoPackage())) {
        m_running.store(false, std::memory_order_release);
        LOG_DEBUG("[Worker] Ended during bootstrap");
        return;
    }

    const auto idleWait = std::chrono::milliseconds(m_config.idleWaitMs);

    while (!m_stopRequested.load(std::memory_order_acquire)) {
        Request request;
        if (!m_requests.waitPop(request, idleWait)) {
            continue;
        }
        if (m_ending.load(std::memory_order_acquire) &&
            (request.type == RequestType::FETCH_SONG || request.type == RequestType::FETCH_ALBUM_COVER)) {
            LOG_DEBUG("[Worker] Session ending, skipping " << request.toWire());
            continue;
        }
        // A popped request is always finished before the stop flag is honored
        if (!dispatch(request)) {
            break;
        }
    }

    m_running.store(false, std::memory_order_release);
    LOG_DEBUG("[Worker] Ended");
}

void SyncWorker::requestStop() {
    m_stopRequested.store(true, std::memory_order_release);
    m_requests.wake();
}

void SyncWorker::requestEndSession() {
    m_ending.store(true, std::memory_order_release);
    m_requests.push(Request::endSession());
}

bool SyncWorker::dispatch(const Request& request) {
    switch (request.type) {
        case RequestType::FETCH_INFO_PACKAGE:
            return fetchInfoPackage();
        case RequestType::FETCH_SONG:
            return fetchSong(request);
        case RequestType::FETCH_ALBUM_COVER:
            return fetchAlbumCover(request);
        case RequestType::UPLOAD_SCORES:
            return uploadScores(request);
        case RequestType::END_SESSION:
            LOG_DEBUG("[Worker] End of session reached");
            return false;
    }
    return true;
}

// ============================================
// Bootstrap
// ============================================

bool SyncWorker::fetchInfoPackage() {
    const RequestType kind = RequestType::FETCH_INFO_PACKAGE;
    IoStatus st = m_transport.sendText(Request::fetchInfoPackage().toWire());
    if (st != IoStatus::OK) {
        return reportFailure(st, kind, "", "info package request");
    }

    std::string archive = m_cache.tempArchivePath();
    st = m_transport.receiveFramedToFile(archive);
    if (st != IoStatus::OK) {
        return reportFailure(st, kind, "", "info package");
    }

    bool extracted = extractZip(archive, m_cache.root());
    m_cache.discard(archive);
    if (!extracted) {
        m_failed++;
        m_signals.push(Signal::transferFailed(kind, "", "info package archive could not be extracted"));
        return true;
    }

    LOG_INFO("Info package received");
    m_hooks.onLibraryReady(m_cache.pathFor(m_config.libraryCacheFile));
    m_hooks.onScoresReady(m_cache.pathFor(m_config.scoreFile));
    return true;
}

// ============================================
// Request Handlers
// ============================================

bool SyncWorker::fetchSong(const Request& request) {
    const RequestType kind = RequestType::FETCH_SONG;
    std::string id = contentAddress(request.path);

    // Requested again while the first copy was still in flight
    if (m_cache.hasSong(id)) {
        LOG_DEBUG("[Worker] Song already cached: " << request.path);
        m_signals.push(Signal::downloadComplete(id));
        return true;
    }

    LOG_DEBUG("[Worker] Fetching song " << request.path << " -> " << id);

    IoStatus st = m_transport.sendText(request.toWire());
    if (st != IoStatus::OK) {
        return reportFailure(st, kind, id, "song request " + request.path);
    }

    std::string archive = m_cache.tempArchivePath();
    st = m_transport.receiveFramedToFile(archive);
    if (st != IoStatus::OK) {
        return reportFailure(st, kind, id, "song " + request.path);
    }

    std::string dir = m_cache.songDir(id);
    std::string staging = ContentCache::stagingPath(dir);
    bool extracted = extractZip(archive, staging);
    m_cache.discard(archive);
    if (!extracted) {
        m_cache.discard(staging);
        m_failed++;
        m_signals.push(Signal::transferFailed(kind, id, "song archive could not be extracted: " + request.path));
        return true;
    }
    if (!m_cache.commit(staging, dir)) {
        m_failed++;
        m_signals.push(Signal::transferFailed(kind, id, "song could not be stored: " + request.path));
        return true;
    }

    m_completed++;
    LOG_INFO("Downloaded " << request.path);
    m_signals.push(Signal::downloadComplete(id));
    return true;
}

bool SyncWorker::fetchAlbumCover(const Request& request) {
    const RequestType kind = RequestType::FETCH_ALBUM_COVER;
    std::string id = contentAddress(request.path);

    if (m_cache.hasAlbumCover(id)) {
        LOG_DEBUG("[Worker] Album cover already cached: " << request.path);
        m_signals.push(Signal::albumCoverComplete(id));
        return true;
    }

    LOG_DEBUG("[Worker] Fetching album cover " << request.path << " -> " << id);

    IoStatus st = m_transport.sendText(request.toWire());
    if (st != IoStatus::OK) {
        return reportFailure(st, kind, id, "album cover request " + request.path);
    }

    std::string cover = m_cache.albumCoverPath(id);
    std::string staging = ContentCache::stagingPath(cover);
    st = m_transport.receiveFramedToFile(staging);
    if (st != IoStatus::OK) {
        return reportFailure(st, kind, id, "album cover " + request.path);
    }
    if (!m_cache.commit(staging, cover)) {
        m_failed++;
        m_signals.push(Signal::transferFailed(kind, id, "album cover could not be stored: " + request.path));
        return true;
    }

    m_completed++;
    LOG_DEBUG("[Worker] Album cover ready: " << request.path);
    m_signals.push(Signal::albumCoverComplete(id));
    return true;
}

bool SyncWorker::uploadScores(const Request& request) {
    // Notification only: the server answers nothing here
    IoStatus st = m_transport.sendText(request.toWire());
    if (st != IoStatus::OK) {
        return reportFailure(st, request.type, "", "score upload notice");
    }
    LOG_DEBUG("[Worker] Score upload notice sent");
    return true;
}

// ============================================
// Failure Reporting
// ============================================

bool SyncWorker::reportFailure(IoStatus status, RequestType source,
                               const std::string& id, const std::string& what) {
    m_failed++;
    std::string detail = what + ": " + ioStatusName(status);
    m_signals.push(Signal::transferFailed(source, id, detail));

    if (status == IoStatus::LOCAL_ERROR) {
        // Payload was drained, the stream is still in step
        LOG_WARN("[Worker] " << detail);
        return true;
    }

    LOG_ERROR("[Worker] " << detail);
    reportConnectionLost(detail);
    return false;
}

void SyncWorker::reportConnectionLost(const std::string& why) {
    LOG_WARN("Lost connection to server (" << why << ")");

    // Whatever is left on the stream can no longer be framed
    m_transport.disconnect();
    m_signals.push(Signal::connectionLost(why));
}
