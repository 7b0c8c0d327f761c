/**
 * @file ContentCache.cpp
 * @brief Cache root management
 */

#include "ContentCache.h"
#include "SyncMessages.h"
#include "LogLevel.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

std::string ContentCache::albumCoversDir() const {
    return (fs::path(m_root) / ALBUM_COVERS_DIR).string();
}

std::string ContentCache::songDir(const std::string& address) const {
    return (fs::path(m_root) / address).string();
}

std::string ContentCache::albumCoverPath(const std::string& address) const {
    return (fs::path(albumCoversDir()) / (address + ALBUM_COVER_EXT)).string();
}

std::string ContentCache::tempArchivePath() const {
    return (fs::path(m_root) / TEMP_ARCHIVE).string();
}

std::string ContentCache::pathFor(const std::string& relative) const {
    return (fs::path(m_root) / relative).string();
}

std::string ContentCache::stagingPath(const std::string& finalPath) {
    return finalPath + STAGING_SUFFIX;
}

bool ContentCache::hasSong(const std::string& address) const {
    std::error_code ec;
    return fs::is_directory(songDir(address), ec);
}

bool ContentCache::hasAlbumCover(const std::string& address) const {
    std::error_code ec;
    return fs::is_regular_file(albumCoverPath(address), ec);
}

bool ContentCache::prepare() {
    if (m_root.empty()) {
        LOG_ERROR("[Cache] No cache root configured");
        return false;
    }

    std::error_code ec;
    if (fs::exists(m_root, ec)) {
        LOG_DEBUG("[Cache] Removing stale cache root " << m_root);
        fs::remove_all(m_root, ec);
        if (ec) {
            LOG_ERROR("[Cache] Cannot remove " << m_root << ": " << ec.message());
            return false;
        }
    }

    fs::create_directories(albumCoversDir(), ec);
    if (ec) {
        LOG_ERROR("[Cache] Cannot create " << albumCoversDir() << ": " << ec.message());
        return false;
    }

    LOG_DEBUG("[Cache] Cache root ready: " << m_root);
    return true;
}

bool ContentCache::destroy() {
    if (m_root.empty()) return true;

    std::error_code ec;
    fs::remove_all(m_root, ec);
    if (ec) {
        LOG_ERROR("[Cache] Cannot remove " << m_root << ": " << ec.message());
        return false;
    }
    LOG_DEBUG("[Cache] Removed cache root " << m_root);
    return true;
}

bool ContentCache::commit(const std::string& stagingPath, const std::string& finalPath) {
    std::error_code ec;
    fs::rename(stagingPath, finalPath, ec);
    if (ec) {
        LOG_ERROR("[Cache] Cannot move " << stagingPath << " to " << finalPath << ": " << ec.message());
        discard(stagingPath);
        return false;
    }
    return true;
}

void ContentCache::discard(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        LOG_WARN("[Cache] Cannot remove " << path << ": " << ec.message());
    }
}
