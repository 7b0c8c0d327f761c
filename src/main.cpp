/**
 * @file main.cpp
 * @brief Main entry point for assetsync
 *
 * Command-line client: connects to the content server, mirrors the
 * requested songs and album covers into the session cache, pumps signals
 * once per frame, then runs the disconnect handshake.
 */

#include "Config.h"
#include "SessionController.h"
#include "SessionHooks.h"
#include "ContentAddress.h"
#include "PendingRequests.h"
#include "LogLevel.h"

#include <iostream>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <thread>
#include <chrono>
#include <atomic>
#include <filesystem>

#define ASSETSYNC_VERSION "0.1.0"

// ============================================
// Signal Handling
// ============================================

std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    (void)signal;
    g_running.store(false, std::memory_order_release);
}

// ============================================
// Bootstrap Hooks
// ============================================

class CliHooks : public SessionHooks {
public:
    void onLibraryReady(const std::string& cacheFile) override {
        std::error_code ec;
        if (std::filesystem::is_regular_file(cacheFile, ec)) {
            LOG_INFO("Library cache: " << cacheFile << " ("
                     << std::filesystem::file_size(cacheFile, ec) << " bytes)");
        } else {
            LOG_WARN("Info package carried no library cache");
        }
    }

    void onScoresReady(const std::string& scoreFile) override {
        std::error_code ec;
        if (std::filesystem::is_regular_file(scoreFile, ec)) {
            LOG_INFO("Score records: " << scoreFile);
        } else {
            LOG_DEBUG("Info package carried no score records");
        }
    }
};

// ============================================
// CLI Parsing
// ============================================

static unsigned int parseMs(const char* value) {
    return static_cast<unsigned int>(std::strtoul(value, nullptr, 10));
}

Config parseArguments(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if ((arg == "--server" || arg == "-s") && i + 1 < argc) {
            config.server = argv[++i];
        }
        else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
            int port = std::atoi(argv[++i]);
            if (port < 1 || port > 65535) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                exit(1);
            }
            config.port = static_cast<uint16_t>(port);
        }
        else if ((arg == "--cache-dir" || arg == "-c") && i + 1 < argc) {
            config.cacheRoot = argv[++i];
        }
        else if (arg == "--score-file" && i + 1 < argc) {
            config.scoreFile = argv[++i];
        }
        else if ((arg == "--download" || arg == "-d") && i + 1 < argc) {
            config.downloads.push_back(argv[++i]);
        }
        else if ((arg == "--album-cover" || arg == "-a") && i + 1 < argc) {
            config.albumCovers.push_back(argv[++i]);
        }
        else if (arg == "--write-scores" || arg == "-w") {
            config.writeScores = true;
        }
        else if (arg == "--ack-timeout" && i + 1 < argc) {
            config.ackTimeoutMs = parseMs(argv[++i]);
        }
        else if (arg == "--transfer-timeout" && i + 1 < argc) {
            config.transferTimeoutMs = parseMs(argv[++i]);
            if (config.transferTimeoutMs == 0) {
                std::cerr << "Transfer timeout must be > 0" << std::endl;
                exit(1);
            }
        }
        else if (arg == "--version" || arg == "-V") {
            config.showVersion = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        }
        else if (arg == "--quiet" || arg == "-q") {
            config.quiet = true;
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            config.logLevel = argv[++i];
            LogLevel level;
            if (!parseLogLevel(config.logLevel, level)) {
                std::cerr << "Invalid log level: " << config.logLevel
                          << " (error, warn, info, debug)" << std::endl;
                exit(1);
            }
        }
        else if (arg == "--help" || arg == "-h") {
            std::cout << "assetsync - Remote content mirror client\n\n"
                      << "Usage: " << argv[0] << " -s <server> [options]\n\n"
                      << "Connection:\n"
                      << "  -s, --server <host>        Content server address (required)\n"
                      << "  -p, --port <port>          Server port (default: " << SYNC_DEFAULT_PORT << ")\n"
                      << "  --ack-timeout <ms>         End of session ack wait (default: 30000, 0 = forever)\n"
                      << "  --transfer-timeout <ms>    Max silence during a transfer (default: 30000)\n"
                      << "\n"
                      << "Cache:\n"
                      << "  -c, --cache-dir <dir>      Session cache root (default: " << defaultCacheRoot() << ")\n"
                      << "  --score-file <name>        Score file inside the cache root (default: " << SCORE_FILE << ")\n"
                      << "\n"
                      << "Requests:\n"
                      << "  -d, --download <path>      Fetch a song bundle (repeatable)\n"
                      << "  -a, --album-cover <path>   Fetch an album cover (repeatable)\n"
                      << "  -w, --write-scores         Notify the server of new scores\n"
                      << "\n"
                      << "Logging:\n"
                      << "  -v, --verbose              Debug output (log level: DEBUG)\n"
                      << "  -q, --quiet                Errors and warnings only (log level: WARN)\n"
                      << "  --log-level <level>        error, warn, info or debug\n"
                      << "\n"
                      << "Other:\n"
                      << "  -V, --version              Show version information\n"
                      << "  -h, --help                 Show this help\n"
                      << "\n"
                      << "Examples:\n"
                      << "  " << argv[0] << " -s 192.168.1.10 -d songs/artist/track\n"
                      << "  " << argv[0] << " -s 192.168.1.10 -a songs/artist/track -w -v\n"
                      << std::endl;
            exit(0);
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            exit(1);
        }
    }

    return config;
}

// ============================================
// Main
// ============================================

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    Config config = parseArguments(argc, argv);

    // Apply log level
    LogLevel level;
    if (!config.logLevel.empty() && parseLogLevel(config.logLevel, level)) {
        g_logLevel = level;
    } else if (config.verbose) {
        g_logLevel = LogLevel::DEBUG;
    } else if (config.quiet) {
        g_logLevel = LogLevel::WARN;
    }
    LOG_DEBUG("Log level: " << logLevelName(g_logLevel));

    if (config.showVersion) {
        std::cout << "Version:  " << ASSETSYNC_VERSION << std::endl;
        std::cout << "Build:    " << __DATE__ << " " << __TIME__ << std::endl;
        return 0;
    }

    if (config.server.empty()) {
        std::cerr << "Error: server address required (-s <host>)" << std::endl;
        return 1;
    }

    LOG_INFO("assetsync v" << ASSETSYNC_VERSION);
    LOG_INFO("  Server: " << config.server << ":" << config.port);
    LOG_INFO("  Cache:  " << (config.cacheRoot.empty() ? defaultCacheRoot() : config.cacheRoot));

    SessionController session(std::make_shared<CliHooks>());

    // Requests still waiting for a completion or failure
    PendingRequests pending;
    bool connectionLost = false;
    size_t failures = 0;

    session.onSignal([&](const Signal& sig) {
        LOG_DEBUG("[Signal] " << signalTypeName(sig.type) << " " << sig.id);
        switch (sig.type) {
            case SignalType::DOWNLOAD_COMPLETE:
                LOG_INFO("Song ready: " << session.cache().songDir(sig.id));
                break;
            case SignalType::ALBUM_COVER_COMPLETE:
                LOG_INFO("Album cover ready: " << session.cache().albumCoverPath(sig.id));
                break;
            case SignalType::TRANSFER_FAILED:
                LOG_ERROR("Transfer failed: " << sig.detail);
                failures++;
                break;
            case SignalType::CONNECTION_LOST:
                LOG_ERROR("Connection lost: " << sig.detail);
                connectionLost = true;
                break;
        }
        if (!pending.resolve(sig) && sig.type != SignalType::CONNECTION_LOST) {
            LOG_DEBUG("[Signal] Not a tracked request: " << sig.id);
        }
    });

    if (!session.start(config)) {
        std::cerr << "Error: could not start session with " << config.server << std::endl;
        return 1;
    }

    for (const auto& path : config.downloads) {
        pending.expect(RequestType::FETCH_SONG, contentAddress(path));
        session.requestDownload(path);
    }
    for (const auto& path : config.albumCovers) {
        pending.expect(RequestType::FETCH_ALBUM_COVER, contentAddress(path));
        session.requestAlbumCover(path);
    }
    if (config.writeScores) {
        session.writeScores();
    }

    // One signal drain per frame
    constexpr auto FRAME = std::chrono::milliseconds(16);
    while (g_running.load(std::memory_order_acquire) && !connectionLost &&
           (!pending.empty() || session.pendingRequests() > 0)) {
        session.checkForSignals();
        std::this_thread::sleep_for(FRAME);
    }
    session.checkForSignals();

    if (!pending.empty()) {
        LOG_WARN(pending.size() << " request(s) did not complete");
    }

    if (failures > 0) {
        LOG_WARN(failures << " transfer(s) failed");
    }

    session.stop();
    return (pending.empty() && failures == 0 && !connectionLost) ? 0 : 1;
}
