/**
 * @file ContentCache.h
 * @brief On-disk layout of the session cache root
 *
 * <root>/<address>/              one directory per song bundle
 * <root>/_album_covers/<address>.png
 * <root>/yarg_cache.json         library cache (from the info package)
 * <root>/yarg_score.json         score records (uploaded at disconnect)
 *
 * An entry's existence is its completion marker. Entries are written under
 * a staging name (<name>.part) and renamed into place only once complete,
 * so a partial transfer never passes hasSong()/hasAlbumCover(). The whole
 * root is wiped at session start and end.
 */

#ifndef ASSETSYNC_CONTENT_CACHE_H
#define ASSETSYNC_CONTENT_CACHE_H

#include <string>

class ContentCache {
public:
    ContentCache() = default;
    explicit ContentCache(const std::string& root) : m_root(root) {}

    void setRoot(const std::string& root) { m_root = root; }
    const std::string& root() const { return m_root; }

    // Paths
    std::string albumCoversDir() const;
    std::string songDir(const std::string& address) const;
    std::string albumCoverPath(const std::string& address) const;
    std::string tempArchivePath() const;
    std::string pathFor(const std::string& relative) const;

    // Where an entry is written before it is complete
    static std::string stagingPath(const std::string& finalPath);

    // Completion checks (cheap, any thread)
    bool hasSong(const std::string& address) const;
    bool hasAlbumCover(const std::string& address) const;

    // Wipe any stale root, then create it empty with the album cover area
    bool prepare();

    // Remove the whole root
    bool destroy();

    // Move a finished staging entry to its final name
    bool commit(const std::string& stagingPath, const std::string& finalPath);

    // Remove one file or directory (partial output, temp archive)
    void discard(const std::string& path);

private:
    std::string m_root;
};

#endif // ASSETSYNC_CONTENT_CACHE_H
