#ifndef SHARDCAST_NET_SOCKET_UTILS_H_
#define SHARDCAST_NET_SOCKET_UTILS_H_

#include <cstdint>
#include <string>

#include "common/scoped_fd.h"

namespace Shardcast {

/**
 * Bind and listen on "host:port" (non-blocking, SO_REUSEADDR).
 * Throws std::system_error if the address cannot be resolved or bound.
 */
ScopedFd CreateListener(const std::string& address);

bool ConfigureNonBlockingSocket(int fd);

// TCP_NODELAY; outbound data is already batched per tick
bool DisableNagle(int fd);

uint16_t LocalPort(int fd);

} // namespace Shardcast

#endif // SHARDCAST_NET_SOCKET_UTILS_H_
