#ifndef SHARDCAST_NET_NOT_IMPLEMENTED_SERVER_H_
#define SHARDCAST_NET_NOT_IMPLEMENTED_SERVER_H_

#include <string>

#include "server.h"

namespace Shardcast {

// Placeholder for platforms without a backend. Every entry point is fatal.
class NotImplementedServer : public ServerDef {
public:
    NotImplementedServer(const std::string& address, const ServerOptions& options);

    bool Drain(const EventCallback& f) override;
    void AllocateBuffers(const std::vector<struct iovec>& buffers) override;
    void WriteAll(Global& global, const std::vector<RefreshItems>& writers) override;
    void SubmitEvents() override;
};

} // namespace Shardcast

#endif // SHARDCAST_NET_NOT_IMPLEMENTED_SERVER_H_
