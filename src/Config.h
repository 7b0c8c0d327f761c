/**
 * @file Config.h
 * @brief Configuration for assetsync
 */

#ifndef ASSETSYNC_CONFIG_H
#define ASSETSYNC_CONFIG_H

#include "SyncMessages.h"

#include <string>
#include <vector>
#include <cstdint>

struct Config {
    // Server connection
    std::string server;
    uint16_t port = SYNC_DEFAULT_PORT;

    // Local cache (empty = default location, see defaultCacheRoot())
    std::string cacheRoot;
    std::string libraryCacheFile = LIBRARY_CACHE_FILE;  // relative to cacheRoot
    std::string scoreFile = SCORE_FILE;                  // relative to cacheRoot

    // Timing
    unsigned int idleWaitMs = 25;           // upper bound of one request-queue wait
    unsigned int pollIntervalMs = 10;       // disconnect handshake poll slice
    unsigned int ackTimeoutMs = 30000;      // 0 = wait for the ack forever
    unsigned int transferTimeoutMs = 30000; // max silence inside one transfer
    uint64_t maxFrameBytes = 4ULL * 1024 * 1024 * 1024;

    // Requests issued by the CLI
    std::vector<std::string> downloads;
    std::vector<std::string> albumCovers;
    bool writeScores = false;

    // Logging
    bool verbose = false;
    bool quiet = false;
    std::string logLevel;   // explicit level name, overrides verbose/quiet

    // Actions
    bool showVersion = false;
};

/**
 * @brief Default cache root: $HOME/.local/share/assetsync/remote, or ./remote
 */
std::string defaultCacheRoot();

#endif // ASSETSYNC_CONFIG_H
