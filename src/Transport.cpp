/**
 * @file Transport.cpp
 * @brief TCP stream implementation
 */

#include "Transport.h"
#include "SyncMessages.h"
#include "LogLevel.h"

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <unistd.h>
#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <vector>

namespace {

constexpr size_t CHUNK_SIZE = 64 * 1024;

}  // namespace

const char* ioStatusName(IoStatus status) {
    switch (status) {
        case IoStatus::OK:          return "ok";
        case IoStatus::TIMEOUT:     return "timed out";
        case IoStatus::CLOSED:      return "connection closed";
        case IoStatus::ERROR:       return "socket error";
        case IoStatus::TOO_LARGE:   return "frame length out of range";
        case IoStatus::LOCAL_ERROR: return "local I/O error";
    }
    return "unknown";
}

// ============================================
// Constructor / Destructor
// ============================================

Transport::Transport() = default;

Transport::~Transport() {
    disconnect();
}

// ============================================
// Connection Management
// ============================================

bool Transport::connect(const std::string& host, uint16_t port) {
    disconnect();
    m_bytesReceived = 0;

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* results = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        LOG_ERROR("[Transport] Cannot resolve " << host << ": " << gai_strerror(rc));
        return false;
    }

    LOG_INFO("Connecting to " << host << ":" << port << "...");

    int lastErrno = 0;
    for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastErrno = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            m_socket = fd;
            break;
        }
        lastErrno = errno;
        close(fd);
    }
    freeaddrinfo(results);

    if (m_socket < 0) {
        LOG_ERROR("[Transport] Failed to connect to " << host << ":" << port
                  << ": " << strerror(lastErrno));
        return false;
    }

    // Commands are tiny and each one waits for its response
    int flag = 1;
    setsockopt(m_socket, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

    m_connected.store(true, std::memory_order_release);
    LOG_INFO("Connected to " << host << ":" << port);
    return true;
}

void Transport::disconnect() {
    m_connected.store(false, std::memory_order_release);
    if (m_socket >= 0) {
        shutdown(m_socket, SHUT_RDWR);
        close(m_socket);
        m_socket = -1;
    }
}

bool Transport::isConnected() const {
    return m_connected.load(std::memory_order_acquire);
}

// ============================================
// Send
// ============================================

IoStatus Transport::sendText(const std::string& text) {
    IoStatus st = sendAll(text.data(), text.size());
    if (st == IoStatus::OK) {
        LOG_DEBUG("[Transport] Sent \"" << text << "\"");
    }
    return st;
}

IoStatus Transport::sendFramed(const void* data, size_t len) {
    uint8_t header[FRAME_HEADER_SIZE];
    encodeFrameLength(len, header);

    IoStatus st = sendAll(header, sizeof(header));
    if (st != IoStatus::OK) return st;
    if (len == 0) return IoStatus::OK;
    return sendAll(data, len);
}

IoStatus Transport::sendFramedFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        LOG_ERROR("[Transport] Cannot open " << path << " for upload");
        return IoStatus::LOCAL_ERROR;
    }
    std::streamoff size = in.tellg();
    if (size < 0) {
        LOG_ERROR("[Transport] Cannot size " << path);
        return IoStatus::LOCAL_ERROR;
    }
    in.seekg(0);

    uint8_t header[FRAME_HEADER_SIZE];
    encodeFrameLength(static_cast<uint64_t>(size), header);
    IoStatus st = sendAll(header, sizeof(header));
    if (st != IoStatus::OK) return st;

    // Once the header is out the peer expects exactly `size` bytes
    std::vector<char> chunk(CHUNK_SIZE);
    uint64_t remaining = static_cast<uint64_t>(size);
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, chunk.size()));
        if (!in.read(chunk.data(), static_cast<std::streamsize>(want))) {
            LOG_ERROR("[Transport] Read failed on " << path << " with "
                      << remaining << " bytes left");
            return IoStatus::LOCAL_ERROR;
        }
        st = sendAll(chunk.data(), want);
        if (st != IoStatus::OK) return st;
        remaining -= want;
    }

    LOG_DEBUG("[Transport] Sent framed file " << path << " (" << size << " bytes)");
    return IoStatus::OK;
}

// ============================================
// Receive
// ============================================

IoStatus Transport::receiveFramedToFile(const std::string& path) {
    uint64_t len = 0;
    IoStatus st = readFrameHeader(len);
    if (st != IoStatus::OK) return st;

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    bool fileOk = static_cast<bool>(file);
    if (!fileOk) {
        LOG_ERROR("[Transport] Cannot open " << path << " for writing, draining "
                  << len << " bytes");
    }

    std::vector<char> chunk(CHUNK_SIZE);
    uint64_t remaining = len;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, chunk.size()));
        st = readExact(chunk.data(), want);
        if (st != IoStatus::OK) {
            LOG_WARN("[Transport] Frame truncated: " << (len - remaining) << "/" << len
                     << " bytes (" << ioStatusName(st) << ")");
            file.close();
            std::remove(path.c_str());
            return st;
        }
        if (fileOk && !file.write(chunk.data(), static_cast<std::streamsize>(want))) {
            LOG_ERROR("[Transport] Write failed on " << path);
            fileOk = false;
        }
        remaining -= want;
        m_bytesReceived += want;
    }

    if (fileOk) {
        file.close();
        fileOk = !file.fail();
    }
    if (!fileOk) {
        std::remove(path.c_str());
        return IoStatus::LOCAL_ERROR;
    }

    LOG_DEBUG("[Transport] Received " << len << " bytes into " << path);
    return IoStatus::OK;
}

IoStatus Transport::receiveText(std::string& out, unsigned int timeoutMs) {
    out.clear();
    IoStatus st = waitReadable(timeoutMs);
    if (st != IoStatus::OK) return st;

    char buf[TEXT_READ_SIZE];
    size_t got = 0;
    st = readSome(buf, sizeof(buf), got);
    if (st != IoStatus::OK) return st;

    out.assign(buf, got);
    return IoStatus::OK;
}

// ============================================
// Socket I/O
// ============================================

IoStatus Transport::waitReadable(unsigned int timeoutMs) {
    if (m_socket < 0) return IoStatus::CLOSED;

    struct pollfd pfd;
    pfd.fd = m_socket;
    pfd.events = POLLIN;
    pfd.revents = 0;

    // A signal landing on this thread restarts the wait with what is left
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    int ready;
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        ready = poll(&pfd, 1, static_cast<int>(left > 0 ? left : 0));
        if (ready >= 0) break;
        int err = errno;
        if (err == EINTR) continue;
        LOG_ERROR("[Transport] Poll error: " << strerror(err));
        m_connected.store(false, std::memory_order_release);
        return IoStatus::ERROR;
    }
    if (ready == 0) return IoStatus::TIMEOUT;

    // POLLHUP with pending data still reads the data first; recv() reports EOF after
    if ((pfd.revents & (POLLERR | POLLNVAL)) && !(pfd.revents & POLLIN)) {
        m_connected.store(false, std::memory_order_release);
        return IoStatus::ERROR;
    }
    return IoStatus::OK;
}

IoStatus Transport::readSome(void* buf, size_t maxLen, size_t& got) {
    got = 0;
    while (true) {
        ssize_t n = recv(m_socket, buf, maxLen, 0);
        if (n > 0) {
            got = static_cast<size_t>(n);
            return IoStatus::OK;
        }
        if (n == 0) {
            m_connected.store(false, std::memory_order_release);
            return IoStatus::CLOSED;
        }
        int err = errno;
        if (err == EINTR) continue;
        if (err == ECONNRESET) {
            m_connected.store(false, std::memory_order_release);
            return IoStatus::CLOSED;
        }
        LOG_ERROR("[Transport] Read error: " << strerror(err));
        m_connected.store(false, std::memory_order_release);
        return IoStatus::ERROR;
    }
}

IoStatus Transport::readExact(void* buf, size_t len) {
    uint8_t* ptr = static_cast<uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        IoStatus st = waitReadable(m_readTimeoutMs);
        if (st != IoStatus::OK) return st;

        size_t got = 0;
        st = readSome(ptr, remaining, got);
        if (st != IoStatus::OK) return st;
        ptr += got;
        remaining -= got;
    }
    return IoStatus::OK;
}

IoStatus Transport::readFrameHeader(uint64_t& len) {
    uint8_t header[FRAME_HEADER_SIZE];
    IoStatus st = readExact(header, sizeof(header));
    if (st != IoStatus::OK) return st;

    len = decodeFrameLength(header);
    if (len > m_maxFrameBytes) {
        LOG_ERROR("[Transport] Invalid frame length: " << len
                  << " (limit " << m_maxFrameBytes << ")");
        return IoStatus::TOO_LARGE;
    }
    return IoStatus::OK;
}

IoStatus Transport::sendAll(const void* buf, size_t len) {
    if (m_socket < 0) return IoStatus::CLOSED;

    const uint8_t* ptr = static_cast<const uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        ssize_t n = send(m_socket, ptr, remaining, MSG_NOSIGNAL);
        if (n <= 0) {
            int err = (n < 0) ? errno : 0;
            if (err == EINTR) continue;
            LOG_ERROR("[Transport] Send error: " << (err ? strerror(err) : "no progress"));
            m_connected.store(false, std::memory_order_release);
            return (err == EPIPE || err == ECONNRESET) ? IoStatus::CLOSED : IoStatus::ERROR;
        }
        ptr += n;
        remaining -= n;
    }
    return IoStatus::OK;
}
