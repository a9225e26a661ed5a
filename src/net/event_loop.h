#ifndef SHARDCAST_NET_EVENT_LOOP_H_
#define SHARDCAST_NET_EVENT_LOOP_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "server.h"

namespace Shardcast {

#ifdef __linux__
class LinuxServer;
using PlatformServer = LinuxServer;
#else
class GenericServer;
using PlatformServer = GenericServer;
#endif

/**
 * The event loop the game server talks to: the best backend for this
 * platform, selected at compile time.
 */
class Server final : public ServerDef {
public:
    Server(const std::string& address, const ServerOptions& options);
    ~Server() override;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    bool Drain(const EventCallback& f) override;
    void AllocateBuffers(const std::vector<struct iovec>& buffers) override;
    void WriteAll(Global& global, const std::vector<RefreshItems>& writers) override;
    void SubmitEvents() override;

    /// Port actually bound, useful when the address asked for port 0.
    uint16_t Port() const;
    size_t NumConnections() const;

private:
    std::unique_ptr<PlatformServer> impl_;
};

} // namespace Shardcast

#endif // SHARDCAST_NET_EVENT_LOOP_H_
