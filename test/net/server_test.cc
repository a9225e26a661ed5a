#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "../../src/net/event_loop.h"
#include "../../src/net/generic_server.h"
#include "../../src/net/io_buf.h"
#include "../../src/net/linux_server.h"
#include "../../src/net/packets.h"

using namespace Shardcast;

namespace {

int ConnectLoopback(uint16_t port, int rcvbuf = 0) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    // Must be set before connect to shrink the advertised window
    if (rcvbuf > 0) {
        setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf));
    }
    struct sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        close(fd);
        return -1;
    }
    return fd;
}

std::vector<uint8_t> ReadExactly(int fd, size_t n) {
    std::vector<uint8_t> out(n);
    size_t got = 0;
    while (got < n) {
        ssize_t r = recv(fd, out.data() + got, n - got, 0);
        if (r <= 0) break;
        got += static_cast<size_t>(r);
    }
    out.resize(got);
    return out;
}

// Collects events until pred holds or the deadline passes
template<typename Pred>
bool DrainUntil(ServerDef& server, std::vector<ServerEvent>* events, Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        bool ok = server.Drain([events](const ServerEvent& e) {
            if (const auto* recv = std::get_if<RecvData>(&e)) {
                // RecvData only borrows the bytes
                events->push_back(RecvData{recv->fd, nullptr, recv->len});
            } else {
                events->push_back(e);
            }
        });
        if (!ok) return false;
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return false;
}

template<typename T>
size_t Count(const std::vector<ServerEvent>& events) {
    size_t n = 0;
    for (const auto& e : events) n += std::holds_alternative<T>(e) ? 1 : 0;
    return n;
}

template<typename T>
size_t LastIndexOf(const std::vector<ServerEvent>& events) {
    size_t index = events.size();
    for (size_t i = 0; i < events.size(); ++i) {
        if (std::holds_alternative<T>(events[i])) index = i;
    }
    return index;
}

template<typename T>
Fd FirstFd(const std::vector<ServerEvent>& events) {
    for (const auto& e : events) {
        if (const auto* t = std::get_if<T>(&e)) return t->fd;
    }
    return Fd();
}

} // namespace

template<typename Backend>
class ServerBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        SetCurrentShard(0);
        ServerOptions options;
        // Small batches so the zero-copy path is exercised on loopback as well
        options.zerocopy_min_bytes = 1;
        server_ = std::make_unique<Backend>("127.0.0.1:0", options);
        bufs_ = std::make_unique<IoBufs>(IoBufs::Init(CompressionThreshold{}, *server_, 2, 1 << 20));
    }

    void TearDown() override {
        for (int fd : clients_) close(fd);
    }

    Fd Accept(int rcvbuf = 0) {
        int fd = ConnectLoopback(server_->Port(), rcvbuf);
        EXPECT_GE(fd, 0);
        clients_.push_back(fd);
        size_t before = Count<AddPlayer>(events_);
        EXPECT_TRUE(DrainUntil(*server_, &events_, [&] { return Count<AddPlayer>(events_) > before; }));
        return FirstFdAfter<AddPlayer>(before);
    }

    template<typename T>
    Fd FirstFdAfter(size_t skip) {
        size_t seen = 0;
        for (const auto& e : events_) {
            if (const auto* t = std::get_if<T>(&e)) {
                if (seen++ == skip) return t->fd;
            }
        }
        return Fd();
    }

    std::unique_ptr<Backend> server_;
    std::unique_ptr<IoBufs> bufs_;
    std::vector<ServerEvent> events_;
    std::vector<int> clients_;
    Global global_;
};

using Backends = ::testing::Types<LinuxServer, GenericServer>;
TYPED_TEST_SUITE(ServerBackendTest, Backends);

TYPED_TEST(ServerBackendTest, AcceptAndReceive) {
    Fd fd = this->Accept();
    EXPECT_NE(fd, Fd());

    const char msg[] = "ping";
    ASSERT_EQ(send(this->clients_[0], msg, 4, 0), 4);
    ASSERT_TRUE(DrainUntil(*this->server_, &this->events_,
                           [this] { return Count<RecvData>(this->events_) > 0; }));
    const auto* recv = std::get_if<RecvData>(&this->events_.back());
    ASSERT_NE(recv, nullptr);
    EXPECT_EQ(recv->fd, fd);
    EXPECT_EQ(recv->len, 4u);
}

TYPED_TEST(ServerBackendTest, OwnPacketsPrecedeBroadcast) {
    Fd fd = this->Accept();

    Packets own(2);
    Broadcast broadcast(2);
    const uint8_t a[] = {'a', 'a'};
    const uint8_t b[] = {'b', 'b', 'b'};
    const uint8_t c[] = {'c'};
    broadcast.AppendRaw(c, sizeof(c), this->bufs_->Get(0));
    own.AppendRaw(a, sizeof(a), this->bufs_->Get(0));
    own.AppendRaw(b, sizeof(b), this->bufs_->Get(1));

    size_t expected = own.PrepareForSend(&broadcast);
    ASSERT_EQ(expected, 3u);

    std::vector<RefreshItems> items;
    items.push_back({&own.GetWriteMut(), fd});
    items.push_back({&broadcast.GetWriteMut(), fd});
    this->server_->WriteAll(this->global_, items);
    this->server_->SubmitEvents();

    EXPECT_EQ(this->global_.writes_queued, 3u);
    EXPECT_EQ(this->global_.bytes_queued, 6u);

    std::vector<uint8_t> got = ReadExactly(this->clients_[0], 6);
    EXPECT_EQ(std::string(got.begin(), got.end()), "aabbbc");

    ASSERT_TRUE(DrainUntil(*this->server_, &this->events_,
                           [this] { return Count<SentData>(this->events_) == 3; }));
    for (const auto& e : this->events_) {
        if (const auto* sent = std::get_if<SentData>(&e)) {
            EXPECT_EQ(sent->fd, fd);
            own.SetSuccessfullySent(1);
        }
    }
    EXPECT_FALSE(own.IsSending());
}

TYPED_TEST(ServerBackendTest, LargeBatchIsFullyDelivered) {
    Fd fd = this->Accept();

    // Bigger than the loopback socket buffer, forcing partial writes
    Packets own(2);
    std::vector<uint8_t> chunk(64 * 1024);
    const size_t chunks = 12;
    for (size_t i = 0; i < chunks; ++i) {
        std::fill(chunk.begin(), chunk.end(), static_cast<uint8_t>(i));
        own.AppendRaw(chunk.data(), chunk.size(), this->bufs_->Get(i % 2));
    }
    size_t expected = own.PrepareForSend();

    std::vector<RefreshItems> items{{&own.GetWriteMut(), fd}};
    this->server_->WriteAll(this->global_, items);
    this->server_->SubmitEvents();

    std::vector<uint8_t> received;
    std::thread reader([&] { received = ReadExactly(this->clients_[0], chunks * chunk.size()); });

    bool done = DrainUntil(*this->server_, &this->events_,
                           [&] { return Count<SentData>(this->events_) == expected; });
    reader.join();
    ASSERT_TRUE(done);
    EXPECT_EQ(received.size(), chunks * chunk.size());
}

TYPED_TEST(ServerBackendTest, HalfClosedPeerReceivesQueuedDataBeforeClose) {
    Fd fd = this->Accept(4096);

    Packets own(2);
    std::vector<uint8_t> chunk(64 * 1024);
    const size_t chunks = 16;
    for (size_t i = 0; i < chunks; ++i) {
        std::fill(chunk.begin(), chunk.end(), static_cast<uint8_t>(i));
        own.AppendRaw(chunk.data(), chunk.size(), this->bufs_->Get(i % 2));
    }
    size_t expected = own.PrepareForSend();
    ASSERT_EQ(expected, chunks);

    std::vector<RefreshItems> items{{&own.GetWriteMut(), fd}};
    this->server_->WriteAll(this->global_, items);
    this->server_->SubmitEvents();

    // The client is done sending but still reading
    ASSERT_EQ(shutdown(this->clients_[0], SHUT_WR), 0);

    std::vector<uint8_t> received;
    std::thread reader([&] { received = ReadExactly(this->clients_[0], chunks * chunk.size()); });

    bool done = DrainUntil(*this->server_, &this->events_,
                           [this] { return Count<RemovePlayer>(this->events_) > 0; });
    reader.join();
    ASSERT_TRUE(done);

    ASSERT_EQ(received.size(), chunks * chunk.size());
    for (size_t i = 0; i < chunks; ++i) {
        EXPECT_EQ(received[i * chunk.size()], static_cast<uint8_t>(i));
    }
    EXPECT_EQ(Count<SentData>(this->events_), expected);
    EXPECT_LT(LastIndexOf<SentData>(this->events_), LastIndexOf<RemovePlayer>(this->events_));
    EXPECT_EQ(FirstFd<RemovePlayer>(this->events_), fd);
    EXPECT_EQ(this->server_->NumConnections(), 0u);
}

TYPED_TEST(ServerBackendTest, DisconnectReportsRemovePlayer) {
    Fd fd = this->Accept();
    close(this->clients_[0]);
    this->clients_.clear();

    ASSERT_TRUE(DrainUntil(*this->server_, &this->events_,
                           [this] { return Count<RemovePlayer>(this->events_) > 0; }));
    EXPECT_EQ(FirstFd<RemovePlayer>(this->events_), fd);
    EXPECT_EQ(this->server_->NumConnections(), 0u);
}

TYPED_TEST(ServerBackendTest, WriteToClosedConnectionIsSkipped) {
    Packets own(2);
    const uint8_t a[] = {'a'};
    own.AppendRaw(a, sizeof(a), this->bufs_->Get(0));

    std::vector<RefreshItems> items{{&own.GetWriteMut(), Fd(987654)}};
    this->server_->WriteAll(this->global_, items);
    this->server_->SubmitEvents();
    EXPECT_EQ(this->global_.writes_queued, 0u);
}

TEST(ServerTest, BindFailureThrows) {
    ServerOptions options;
    EXPECT_THROW(Server("definitely-not-an-address", options), std::system_error);
}

TEST(ServerTest, PortZeroPicksEphemeralPort) {
    Server server("127.0.0.1:0", ServerOptions{});
    EXPECT_NE(server.Port(), 0);
    EXPECT_EQ(server.NumConnections(), 0u);
}

TEST(ServerDeathTest, SecondRegistrationIsFatal) {
    Server server("127.0.0.1:0", ServerOptions{});
    Ring ring(4096);
    std::vector<struct iovec> buffers{ring.AsIovec()};
    server.AllocateBuffers(buffers);
    EXPECT_DEATH(server.AllocateBuffers(buffers), "AllocateBuffers called twice");
}
