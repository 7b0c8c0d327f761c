/**
 * @file SyncMessages.h
 * @brief Message definitions for the asset sync protocol
 *
 * Two shapes share one TCP stream:
 *   Plain command:   raw UTF-8 text, one write, no length and no terminator
 *   Framed payload:  [8 length LE][payload]
 *
 * Plain commands rely on strict request/response alternation: the stream
 * carries no delimiter, so two commands written back to back may be read
 * by the server as one. Never pipeline.
 */

#ifndef ASSETSYNC_SYNC_MESSAGES_H
#define ASSETSYNC_SYNC_MESSAGES_H

#include <cstdint>
#include <cstddef>
#include <string>

// ============================================
// Protocol Constants
// ============================================

constexpr uint16_t SYNC_DEFAULT_PORT = 6145;
constexpr size_t FRAME_HEADER_SIZE = 8;
constexpr size_t TEXT_READ_SIZE = 1024;

// Client -> Server commands
constexpr char CMD_FETCH_INFO_PACKAGE[] = "FetchInfoPackage";
constexpr char CMD_FETCH_SONG[]         = "FetchSong";
constexpr char CMD_FETCH_ALBUM_COVER[]  = "FetchAlbumCover";
constexpr char CMD_UPLOAD_SCORES[]      = "UploadScores";
constexpr char CMD_END_SESSION[]        = "EndSession";
constexpr char CMD_ARG_SEPARATOR        = ',';

// Server -> Client acknowledgment preceding the final score upload
constexpr char ACK_END_SESSION[] = "ReqInfoPkgThenEnd";

// Cache root layout
constexpr char ALBUM_COVERS_DIR[]   = "_album_covers";
constexpr char ALBUM_COVER_EXT[]    = ".png";
constexpr char TEMP_ARCHIVE[]       = "download.zip";
constexpr char STAGING_SUFFIX[]     = ".part";
constexpr char LIBRARY_CACHE_FILE[] = "yarg_cache.json";
constexpr char SCORE_FILE[]         = "yarg_score.json";

// ============================================
// Requests (caller -> worker)
// ============================================

enum class RequestType {
    FETCH_INFO_PACKAGE,
    FETCH_SONG,
    FETCH_ALBUM_COVER,
    UPLOAD_SCORES,
    END_SESSION
};

struct Request {
    RequestType type = RequestType::END_SESSION;
    std::string path;   // FETCH_SONG / FETCH_ALBUM_COVER only

    static Request fetchInfoPackage() { return {RequestType::FETCH_INFO_PACKAGE, {}}; }
    static Request fetchSong(const std::string& p) { return {RequestType::FETCH_SONG, p}; }
    static Request fetchAlbumCover(const std::string& p) { return {RequestType::FETCH_ALBUM_COVER, p}; }
    static Request uploadScores() { return {RequestType::UPLOAD_SCORES, {}}; }
    static Request endSession() { return {RequestType::END_SESSION, {}}; }

    // Plain command text as written on the wire
    std::string toWire() const {
        switch (type) {
            case RequestType::FETCH_INFO_PACKAGE:
                return CMD_FETCH_INFO_PACKAGE;
            case RequestType::FETCH_SONG:
                return std::string(CMD_FETCH_SONG) + CMD_ARG_SEPARATOR + path;
            case RequestType::FETCH_ALBUM_COVER:
                return std::string(CMD_FETCH_ALBUM_COVER) + CMD_ARG_SEPARATOR + path;
            case RequestType::UPLOAD_SCORES:
                return CMD_UPLOAD_SCORES;
            case RequestType::END_SESSION:
                return CMD_END_SESSION;
        }
        return {};
    }
};

// ============================================
// Signals (worker -> caller)
// ============================================

enum class SignalType {
    DOWNLOAD_COMPLETE,
    ALBUM_COVER_COMPLETE,
    TRANSFER_FAILED,     // one item aborted, loop continues
    CONNECTION_LOST      // worker loop exited, requests stay queued
};

struct Signal {
    SignalType type = SignalType::DOWNLOAD_COMPLETE;
    RequestType source = RequestType::FETCH_SONG;  // request kind the signal answers
    std::string id;      // content address (empty for the info package)
    std::string detail;  // failure description

    static Signal downloadComplete(const std::string& id) {
        return {SignalType::DOWNLOAD_COMPLETE, RequestType::FETCH_SONG, id, {}};
    }
    static Signal albumCoverComplete(const std::string& id) {
        return {SignalType::ALBUM_COVER_COMPLETE, RequestType::FETCH_ALBUM_COVER, id, {}};
    }
    static Signal transferFailed(RequestType source, const std::string& id, const std::string& why) {
        return {SignalType::TRANSFER_FAILED, source, id, why};
    }
    static Signal connectionLost(const std::string& why) {
        return {SignalType::CONNECTION_LOST, RequestType::END_SESSION, {}, why};
    }
};

inline const char* signalTypeName(SignalType type) {
    switch (type) {
        case SignalType::DOWNLOAD_COMPLETE:    return "DownloadComplete";
        case SignalType::ALBUM_COVER_COMPLETE: return "AlbumCoverComplete";
        case SignalType::TRANSFER_FAILED:      return "TransferFailed";
        case SignalType::CONNECTION_LOST:      return "ConnectionLost";
    }
    return "Unknown";
}

// ============================================
// Framed payload header (little-endian, byte order independent of host)
// ============================================

inline void encodeFrameLength(uint64_t len, uint8_t out[FRAME_HEADER_SIZE]) {
    for (size_t i = 0; i < FRAME_HEADER_SIZE; i++) {
        out[i] = static_cast<uint8_t>((len >> (8 * i)) & 0xFF);
    }
}

inline uint64_t decodeFrameLength(const uint8_t in[FRAME_HEADER_SIZE]) {
    uint64_t len = 0;
    for (size_t i = 0; i < FRAME_HEADER_SIZE; i++) {
        len |= static_cast<uint64_t>(in[i]) << (8 * i);
    }
    return len;
}

#endif // ASSETSYNC_SYNC_MESSAGES_H
