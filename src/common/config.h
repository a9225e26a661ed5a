#ifndef SHARDCAST_COMMON_CONFIG_H_
#define SHARDCAST_COMMON_CONFIG_H_

#include <cstddef>
#include <cstdint>

namespace Shardcast {

/// The protocol version this server currently targets.
constexpr int32_t PROTOCOL_VERSION = 763;

/// The stringified name of the game version this server currently targets.
constexpr char MINECRAFT_VERSION[] = "1.20.1";

/// The maximum number of bytes that can be sent in a single packet frame.
constexpr size_t MAX_PACKET_SIZE = 2097152;

/// Outbound ring buffer size per shard (128 MiB * num_shards in total)
constexpr size_t S2C_BUFFER_SIZE = 1024UL * 1024 * 128;

/// Default compression threshold handed to new connections, in bytes.
constexpr int32_t DEFAULT_COMPRESSION_THRESHOLD = 256;

/// Default zlib level for per-shard compressors.
constexpr int DEFAULT_COMPRESSION_LEVEL = 4;

constexpr size_t CACHELINE_SIZE = 64;

} // namespace Shardcast

#endif // SHARDCAST_COMMON_CONFIG_H_
