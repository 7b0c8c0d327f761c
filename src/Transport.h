/**
 * @file Transport.h
 * @brief TCP stream owner for the asset sync protocol
 *
 * Sends plain commands and framed payloads, receives framed payloads
 * straight into a file, and unframed text. Short reads
 * and short writes are always looped. Every read waits with poll() so
 * a silent peer cannot hang the caller past the read timeout.
 */

#ifndef ASSETSYNC_TRANSPORT_H
#define ASSETSYNC_TRANSPORT_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

enum class IoStatus {
    OK,
    TIMEOUT,      // nothing arrived within the read timeout
    CLOSED,       // peer closed, possibly mid-frame
    ERROR,        // socket error
    TOO_LARGE,    // length header above the frame limit
    LOCAL_ERROR   // local file could not be read or written
};

const char* ioStatusName(IoStatus status);

class Transport {
public:
    Transport();
    ~Transport();

    // Non-copyable
    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Lifecycle
    bool connect(const std::string& host, uint16_t port);
    void disconnect();
    bool isConnected() const;

    // Limits (set before use)
    void setReadTimeout(unsigned int ms) { m_readTimeoutMs = ms; }
    void setMaxFrameBytes(uint64_t bytes) { m_maxFrameBytes = bytes; }

    // Plain command: the text bytes, nothing else
    IoStatus sendText(const std::string& text);

    // Framed payload: 8-byte little-endian length, then the bytes
    IoStatus sendFramed(const void* data, size_t len);
    IoStatus sendFramedFile(const std::string& path);

    // Receive a framed payload into a file. If the file cannot be written
    // the payload is still consumed and LOCAL_ERROR is returned. A partial
    // file is removed on any failure.
    IoStatus receiveFramedToFile(const std::string& path);

    // Wait up to timeoutMs for data, then read whatever is available
    // (at most TEXT_READ_SIZE bytes) as text. TIMEOUT if nothing arrived.
    IoStatus receiveText(std::string& out, unsigned int timeoutMs);

    // Total payload bytes received since connect (frames only)
    uint64_t getBytesReceived() const { return m_bytesReceived; }

private:
    int m_socket = -1;
    std::atomic<bool> m_connected{false};
    unsigned int m_readTimeoutMs = 30000;
    uint64_t m_maxFrameBytes = 4ULL * 1024 * 1024 * 1024;
    uint64_t m_bytesReceived = 0;

    // Socket I/O helpers
    IoStatus waitReadable(unsigned int timeoutMs);
    IoStatus readSome(void* buf, size_t maxLen, size_t& got);
    IoStatus readExact(void* buf, size_t len);
    IoStatus readFrameHeader(uint64_t& len);
    IoStatus sendAll(const void* buf, size_t len);
};

#endif // ASSETSYNC_TRANSPORT_H
