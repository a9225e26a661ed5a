#ifndef SHARDCAST_NET_LINUX_SERVER_H_
#define SHARDCAST_NET_LINUX_SERVER_H_

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include <sys/epoll.h>

#include <absl/container/flat_hash_map.h>

#include "common/scoped_fd.h"
#include "outbound_queue.h"
#include "server.h"

namespace Shardcast {

/**
 * Zero-copy backend: epoll for readiness, sendmsg(MSG_ZEROCOPY) scatter-gather
 * sends straight out of the registered rings.
 *
 * With zero-copy the kernel keeps reading the ring after sendmsg() returns, so
 * SentData is only reported once the completion notification for that send has
 * been read from the socket's error queue. Batches below zerocopy_min_bytes, and
 * sockets that refuse SO_ZEROCOPY, are sent by copy and complete immediately.
 */
class LinuxServer : public ServerDef {
public:
    LinuxServer(const std::string& address, const ServerOptions& options);
    ~LinuxServer() override;

    bool Drain(const EventCallback& f) override;
    void AllocateBuffers(const std::vector<struct iovec>& buffers) override;
    void WriteAll(Global& global, const std::vector<RefreshItems>& writers) override;
    void SubmitEvents() override;

    uint16_t Port() const;
    size_t NumConnections() const { return connections_.size(); }

private:
    // One sendmsg(MSG_ZEROCOPY) call awaiting its notification
    struct ZeroCopySend {
        uint32_t seq;
        size_t completed_entries;
        bool done;
    };

    struct Connection {
        ScopedFd sock;
        OutboundQueue queue;
        bool zerocopy = false;
        bool want_write = false;
        bool dirty = false;
        // Peer shut down its write side; closed once everything queued is out
        bool read_closed = false;
        uint32_t interest = 0;
        uint32_t next_zc_seq = 0;
        std::deque<ZeroCopySend> zc_inflight;
    };

    void AcceptConnections(const EventCallback& f);
    bool ReadFromConnection(int fd, const EventCallback& f);
    bool ReapErrorQueue(int fd, Connection& conn);
    bool FlushConnection(int fd, Connection& conn);
    void UpdateInterest(int fd, Connection& conn, bool want_write);
    void ShutdownRead(int fd, Connection& conn);
    void CloseIfFinished(int fd, const Connection& conn);
    void CloseConnection(int fd);
    bool IsRegistered(const PacketWriteInfo& info) const;

    // Reported right away inside Drain(), otherwise on the next Drain()
    void Emit(const ServerEvent& event);

    ServerOptions options_;
    ScopedFd listener_;
    ScopedFd epoll_fd_;
    std::vector<struct epoll_event> events_;
    std::vector<uint8_t> recv_buf_;

    absl::flat_hash_map<int, std::unique_ptr<Connection>> connections_;
    std::vector<int> dirty_;
    const EventCallback* current_ = nullptr;
    std::deque<ServerEvent> deferred_;

    std::vector<struct iovec> registered_;
    bool pinned_ = false;
    uint64_t zerocopy_copied_ = 0;
};

} // namespace Shardcast

#endif // SHARDCAST_NET_LINUX_SERVER_H_
