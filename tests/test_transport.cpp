/**
 * @file test_transport.cpp
 * @brief Framing and stream tests against a loopback server
 */

#include <gtest/gtest.h>

#include "Transport.h"
#include "SyncMessages.h"
#include "MockServer.h"
#include "TestUtil.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

#include <pthread.h>
#include <signal.h>

using namespace std::chrono_literals;

namespace {

std::vector<uint8_t> pattern(size_t len) {
    std::vector<uint8_t> data(len);
    for (size_t i = 0; i < len; i++) data[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    return data;
}

}  // namespace

// ============================================
// Connection
// ============================================

TEST(Transport, ConnectFailsWithoutListener)
{
    Transport transport;
    EXPECT_FALSE(transport.connect("127.0.0.1", unusedPort()));
    EXPECT_FALSE(transport.isConnected());
}

// ============================================
// Receive
// ============================================

TEST(Transport, ReassemblesPayloadFromSmallWrites)
{
    const std::vector<uint8_t> payload = pattern(100000);

    MockServer server;
    server.serve({[&payload](MockConnection& conn) {
        uint8_t header[FRAME_HEADER_SIZE];
        encodeFrameLength(payload.size(), header);
        // Header split across two writes
        conn.sendRaw(header, 3);
        std::this_thread::sleep_for(5ms);
        conn.sendRaw(header + 3, FRAME_HEADER_SIZE - 3);

        for (size_t off = 0; off < payload.size(); off += 1000) {
            size_t n = std::min<size_t>(1000, payload.size() - off);
            conn.sendRaw(payload.data() + off, n);
            if (off % 20000 == 0) std::this_thread::sleep_for(2ms);
        }
        conn.waitClosed();
    }});

    TempDir tmp;
    Transport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));

    ASSERT_EQ(transport.receiveFramedToFile(tmp.str("out.bin")), IoStatus::OK);
    EXPECT_EQ(readBytes(tmp.path() / "out.bin"), payload);
    EXPECT_EQ(transport.getBytesReceived(), payload.size());
}

TEST(Transport, ReceivesIntoFile)
{
    TempDir tmp;
    const std::vector<uint8_t> payload = pattern(300000);

    MockServer server;
    server.serve({[&payload](MockConnection& conn) {
        conn.sendFrame(payload);
        conn.waitClosed();
    }});

    Transport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));
    ASSERT_EQ(transport.receiveFramedToFile(tmp.str("out.bin")), IoStatus::OK);
    EXPECT_EQ(readBytes(tmp.path() / "out.bin"), payload);
}

TEST(Transport, EmptyFrameGivesEmptyFile)
{
    TempDir tmp;

    MockServer server;
    server.serve({[](MockConnection& conn) {
        conn.sendFrame({});
        conn.waitClosed();
    }});

    Transport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));
    ASSERT_EQ(transport.receiveFramedToFile(tmp.str("empty.bin")), IoStatus::OK);
    EXPECT_TRUE(fs::is_regular_file(tmp.path() / "empty.bin"));
    EXPECT_EQ(fs::file_size(tmp.path() / "empty.bin"), 0u);
}

TEST(Transport, TruncatedFrameLeavesNoFile)
{
    TempDir tmp;

    MockServer server;
    server.serve({[](MockConnection& conn) {
        conn.sendFrameHeader(1000);
        std::vector<uint8_t> part(10, 0x42);
        conn.sendRaw(part.data(), part.size());
        conn.close();
    }});

    Transport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));
    EXPECT_EQ(transport.receiveFramedToFile(tmp.str("partial.bin")), IoStatus::CLOSED);
    EXPECT_FALSE(fs::exists(tmp.path() / "partial.bin"));
    EXPECT_FALSE(transport.isConnected());
}

TEST(Transport, RejectsOversizedFrame)
{
    MockServer server;
    server.serve({[](MockConnection& conn) {
        conn.sendFrameHeader(1ULL << 40);
        conn.waitClosed();
    }});

    Transport transport;
    transport.setMaxFrameBytes(1024);
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));

    TempDir tmp;
    EXPECT_EQ(transport.receiveFramedToFile(tmp.str("big.bin")), IoStatus::TOO_LARGE);
    EXPECT_FALSE(fs::exists(tmp.path() / "big.bin"));
}

TEST(Transport, SilentPeerTimesOut)
{
    MockServer server;
    server.serve({[](MockConnection& conn) {
        conn.sendFrameHeader(100);
        conn.waitClosed();
    }});

    Transport transport;
    transport.setReadTimeout(100);
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));

    TempDir tmp;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(transport.receiveFramedToFile(tmp.str("slow.bin")), IoStatus::TIMEOUT);
    EXPECT_FALSE(fs::exists(tmp.path() / "slow.bin"));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
}

TEST(Transport, InterruptedWaitKeepsReading)
{
    // Handler without SA_RESTART: poll() returns EINTR on every delivery
    struct sigaction action{};
    struct sigaction previous{};
    action.sa_handler = [](int) {};
    sigemptyset(&action.sa_mask);
    ASSERT_EQ(sigaction(SIGUSR1, &action, &previous), 0);

    TempDir tmp;
    const std::vector<uint8_t> payload = pattern(4096);

    MockServer server;
    server.serve({[&payload](MockConnection& conn) {
        conn.sendFrameHeader(payload.size());
        std::this_thread::sleep_for(300ms);
        conn.sendRaw(payload.data(), payload.size());
        conn.waitClosed();
    }});

    Transport transport;
    transport.setReadTimeout(2000);
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));

    const pthread_t reader = pthread_self();
    std::atomic<bool> done{false};
    std::thread interrupter([&]() {
        while (!done.load()) {
            std::this_thread::sleep_for(20ms);
            pthread_kill(reader, SIGUSR1);
        }
    });

    IoStatus st = transport.receiveFramedToFile(tmp.str("out.bin"));
    done = true;
    interrupter.join();
    sigaction(SIGUSR1, &previous, nullptr);

    ASSERT_EQ(st, IoStatus::OK);
    EXPECT_EQ(readBytes(tmp.path() / "out.bin"), payload);
    EXPECT_TRUE(transport.isConnected());
}

TEST(Transport, UnwritableDestinationKeepsStreamInStep)
{
    TempDir tmp;
    const std::vector<uint8_t> first = pattern(70000);
    const std::vector<uint8_t> second = {1, 2, 3, 4, 5};

    MockServer server;
    server.serve({[&](MockConnection& conn) {
        conn.sendFrame(first);
        conn.sendFrame(second);
        conn.waitClosed();
    }});

    Transport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));

    EXPECT_EQ(transport.receiveFramedToFile(tmp.str("missing-dir/out.bin")), IoStatus::LOCAL_ERROR);
    EXPECT_TRUE(transport.isConnected());

    ASSERT_EQ(transport.receiveFramedToFile(tmp.str("second.bin")), IoStatus::OK);
    EXPECT_EQ(readBytes(tmp.path() / "second.bin"), second);
}

TEST(Transport, ReceiveTextTimesOut)
{
    MockServer server;
    server.serve({[](MockConnection& conn) {
        conn.waitClosed();
    }});

    Transport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));

    std::string text = "leftover";
    EXPECT_EQ(transport.receiveText(text, 30), IoStatus::TIMEOUT);
    EXPECT_TRUE(text.empty());
}

TEST(Transport, ReceiveTextReportsClose)
{
    MockServer server;
    server.serve({[](MockConnection& conn) {
        conn.sendText(ACK_END_SESSION);
        conn.close();
    }});

    Transport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));

    std::string text;
    ASSERT_EQ(transport.receiveText(text, 2000), IoStatus::OK);
    EXPECT_EQ(text, ACK_END_SESSION);
    EXPECT_EQ(transport.receiveText(text, 2000), IoStatus::CLOSED);
}

// ============================================
// Send
// ============================================

TEST(Transport, SendTextIsUnframed)
{
    std::string got;
    MockServer server;
    server.serve({[&got](MockConnection& conn) {
        char buf[32] = {};
        if (conn.readExact(buf, 17)) got.assign(buf, 17);
        conn.waitClosed();
    }});

    Transport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));
    ASSERT_EQ(transport.sendText("FetchSong,songs/a"), IoStatus::OK);
    transport.disconnect();
    server.join();

    EXPECT_EQ(got, "FetchSong,songs/a");
}

TEST(Transport, SendFramedFileWritesLittleEndianHeader)
{
    TempDir tmp;
    const std::vector<uint8_t> payload = pattern(300);
    writeBytes(tmp.path() / "scores.zip", payload);

    uint8_t header[FRAME_HEADER_SIZE] = {};
    std::vector<uint8_t> body;
    MockServer server;
    server.serve({[&](MockConnection& conn) {
        if (conn.readExact(header, sizeof(header))) {
            body.resize(static_cast<size_t>(decodeFrameLength(header)));
            conn.readExact(body.data(), body.size());
        }
        conn.waitClosed();
    }});

    Transport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));
    ASSERT_EQ(transport.sendFramedFile(tmp.str("scores.zip")), IoStatus::OK);
    transport.disconnect();
    server.join();

    const uint8_t expected[FRAME_HEADER_SIZE] = {0x2C, 0x01, 0, 0, 0, 0, 0, 0};
    for (size_t i = 0; i < FRAME_HEADER_SIZE; i++) {
        EXPECT_EQ(header[i], expected[i]) << "byte " << i;
    }
    EXPECT_EQ(body, payload);
}

TEST(Transport, SendFramedFileMissingSource)
{
    MockServer server;
    server.serve({[](MockConnection& conn) {
        conn.waitClosed();
    }});

    Transport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));
    EXPECT_EQ(transport.sendFramedFile("/nonexistent/scores.zip"), IoStatus::LOCAL_ERROR);
}

TEST(Transport, SendAfterPeerCloseFails)
{
    MockServer server;
    server.serve({[](MockConnection& conn) {
        conn.close();
    }});

    Transport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", server.port()));
    server.join();

    // The first write may still be accepted by the local stack
    std::vector<uint8_t> chunk(64 * 1024, 0);
    IoStatus st = IoStatus::OK;
    for (int i = 0; i < 50 && st == IoStatus::OK; i++) {
        st = transport.sendFramed(chunk.data(), chunk.size());
        std::this_thread::sleep_for(2ms);
    }
    EXPECT_NE(st, IoStatus::OK);
}
