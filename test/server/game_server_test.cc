#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "../../src/net/compressor.h"
#include "../../src/net/decoder.h"
#include "../../src/net/encoder.h"
#include "../../src/server/game_server.h"

using namespace Shardcast;

namespace {

class TestClient {
public:
    explicit TestClient(uint16_t port) {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        struct sockaddr_in addr = {};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        connected_ = connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0;
    }
    ~TestClient() { close(fd_); }

    bool connected() const { return connected_; }

    template<typename P>
    void Send(const P& pkt, CompressionThreshold threshold) {
        PacketEncoder encoder(threshold);
        PacketWriteInfo info;
        ASSERT_EQ(encoder.AppendPacket(pkt, ring_, scratch_, compressor_, &info), EncodeStatus::kOk);
        ASSERT_EQ(send(fd_, info.start_ptr, info.len, 0), static_cast<ssize_t>(info.len));
    }

    void SendRaw(const uint8_t* data, size_t len) {
        ASSERT_EQ(send(fd_, data, len, 0), static_cast<ssize_t>(len));
    }

    // Reads whatever is available without blocking and returns decoded packet ids
    std::vector<int32_t> Poll() {
        std::vector<int32_t> ids;
        uint8_t buf[4096];
        struct pollfd pfd{fd_, POLLIN, 0};
        while (poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN)) {
            ssize_t r = recv(fd_, buf, sizeof(buf), 0);
            if (r <= 0) break;
            decoder_.QueueBytes(buf, static_cast<size_t>(r));
        }
        PacketFrame frame;
        while (decoder_.TryNextPacket(&frame) == DecodeStatus::kOk) {
            ids.push_back(frame.id);
            if (frame.id == SetCompression::kId) {
                int32_t threshold = 0;
                size_t n = 0;
                varint::Read(frame.body, frame.body_len, &threshold, &n);
                decoder_.SetCompression(CompressionThreshold{threshold});
            }
            if (frame.id == ChatMessage::kId) {
                int32_t len = 0;
                size_t n = 0;
                if (varint::Read(frame.body, frame.body_len, &len, &n) == varint::ReadResult::kOk &&
                    len >= 0 && n + static_cast<size_t>(len) <= frame.body_len) {
                    chats_.emplace_back(reinterpret_cast<const char*>(frame.body) + n, static_cast<size_t>(len));
                }
            }
        }
        return ids;
    }

    const std::vector<std::string>& chats() const { return chats_; }

private:
    int fd_;
    bool connected_ = false;
    Ring ring_{1 << 16};
    Scratch scratch_;
    Compressor compressor_{DEFAULT_COMPRESSION_LEVEL};
    PacketDecoder decoder_;
    std::vector<std::string> chats_;
};

// Serverbound chat (0x05): VarInt(len) text
RawPacket ChatCommand(const std::string& text) {
    RawPacket pkt{0x05, {}};
    varint::Append(static_cast<int32_t>(text.size()), &pkt.body);
    pkt.body.insert(pkt.body.end(), text.begin(), text.end());
    return pkt;
}

GameServerOptions TestOptions() {
    GameServerOptions options;
    options.address = "127.0.0.1:0";
    options.num_shards = 2;
    options.ring_buffer_size = 1 << 20;
    options.threshold = CompressionThreshold{64};
    options.keepalive_ticks = 0;
    return options;
}

// Ticks until pred holds
template<typename Pred>
bool TickUntil(GameServer& server, Pred pred) {
    for (int i = 0; i < 2000; ++i) {
        if (!server.Tick()) return false;
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return false;
}

} // namespace

TEST(GameServerTest, NewPlayerReceivesSetCompression) {
    GameServer server(TestOptions());
    TestClient client(server.Port());
    ASSERT_TRUE(client.connected());

    std::vector<int32_t> ids;
    ASSERT_TRUE(TickUntil(server, [&] {
        auto got = client.Poll();
        ids.insert(ids.end(), got.begin(), got.end());
        return !ids.empty();
    }));
    EXPECT_EQ(ids.front(), SetCompression::kId);
    EXPECT_EQ(server.NumPlayers(), 1u);
}

TEST(GameServerTest, ChatIsBroadcastToEveryone) {
    GameServer server(TestOptions());
    TestClient alice(server.Port());
    TestClient bob(server.Port());
    ASSERT_TRUE(TickUntil(server, [&] { return server.NumPlayers() == 2; }));
    ASSERT_TRUE(TickUntil(server, [&] {
        alice.Poll();
        bob.Poll();
        return server.global().writes_queued >= 2;
    }));

    // Long enough to be compressed
    std::string text(200, 'x');
    alice.Send(ChatCommand(text), CompressionThreshold{64});

    ASSERT_TRUE(TickUntil(server, [&] {
        alice.Poll();
        bob.Poll();
        return !alice.chats().empty() && !bob.chats().empty();
    }));
    EXPECT_EQ(alice.chats().front(), text);
    EXPECT_EQ(bob.chats().front(), text);
}

TEST(GameServerTest, KeepAliveIsEchoed) {
    GameServer server(TestOptions());
    TestClient client(server.Port());
    ASSERT_TRUE(TickUntil(server, [&] { return !client.Poll().empty(); }));

    // Serverbound keep alive (0x12) carries the same long
    RawPacket keepalive{0x12, {0, 0, 0, 0, 0, 0, 0x30, 0x39}};
    client.Send(keepalive, CompressionThreshold{64});

    std::vector<int32_t> ids;
    ASSERT_TRUE(TickUntil(server, [&] {
        auto got = client.Poll();
        ids.insert(ids.end(), got.begin(), got.end());
        return !ids.empty();
    }));
    EXPECT_EQ(ids.front(), KeepAlive::kId);
}

TEST(GameServerTest, PeriodicKeepAliveBroadcast) {
    GameServerOptions options = TestOptions();
    options.keepalive_ticks = 5;
    GameServer server(options);
    TestClient client(server.Port());

    size_t keepalives = 0;
    ASSERT_TRUE(TickUntil(server, [&] {
        for (int32_t id : client.Poll()) keepalives += id == KeepAlive::kId ? 1 : 0;
        return keepalives >= 2;
    }));
}

TEST(GameServerTest, DisconnectRemovesPlayer) {
    GameServer server(TestOptions());
    {
        TestClient client(server.Port());
        ASSERT_TRUE(TickUntil(server, [&] { return server.NumPlayers() == 1; }));
    }
    ASSERT_TRUE(TickUntil(server, [&] { return server.NumPlayers() == 0; }));
}

TEST(GameServerTest, GarbageInputDoesNotAffectOthers) {
    GameServer server(TestOptions());
    TestClient bad(server.Port());
    TestClient good(server.Port());
    ASSERT_TRUE(TickUntil(server, [&] { return server.NumPlayers() == 2; }));

    // Overlong VarInt length prefix
    const uint8_t garbage[] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    bad.SendRaw(garbage, sizeof(garbage));

    good.Send(ChatCommand("still here"), CompressionThreshold{64});
    ASSERT_TRUE(TickUntil(server, [&] {
        good.Poll();
        return !good.chats().empty();
    }));
    EXPECT_EQ(good.chats().front(), "still here");
}
