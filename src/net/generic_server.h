#ifndef SHARDCAST_NET_GENERIC_SERVER_H_
#define SHARDCAST_NET_GENERIC_SERVER_H_

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "common/scoped_fd.h"
#include "outbound_queue.h"
#include "server.h"

namespace Shardcast {

/**
 * Portable backend built on poll() and copying sendmsg(). Connections are
 * identified by a counter, so an Fd is never reused while the process lives.
 */
class GenericServer : public ServerDef {
public:
    GenericServer(const std::string& address, const ServerOptions& options);
    ~GenericServer() override = default;

    bool Drain(const EventCallback& f) override;
    void AllocateBuffers(const std::vector<struct iovec>& buffers) override;
    void WriteAll(Global& global, const std::vector<RefreshItems>& writers) override;
    void SubmitEvents() override;

    uint16_t Port() const;
    size_t NumConnections() const { return connections_.size(); }

private:
    struct Connection {
        ScopedFd sock;
        OutboundQueue queue;
        bool want_write = false;
        bool dirty = false;
        bool read_closed = false;
    };

    void AcceptConnections(const EventCallback& f);
    bool ReadFromConnection(int64_t id, Connection& conn, const EventCallback& f);
    bool FlushConnection(int64_t id, Connection& conn);
    void CloseIfFinished(int64_t id, const Connection& conn);
    void CloseConnection(int64_t id);
    void Emit(const ServerEvent& event);

    ServerOptions options_;
    ScopedFd listener_;
    std::vector<uint8_t> recv_buf_;

    int64_t next_id_ = 0;
    absl::flat_hash_map<int64_t, std::unique_ptr<Connection>> connections_;
    std::vector<int64_t> dirty_;
    const EventCallback* current_ = nullptr;
    std::deque<ServerEvent> deferred_;

    std::vector<struct iovec> registered_;
};

} // namespace Shardcast

#endif // SHARDCAST_NET_GENERIC_SERVER_H_
