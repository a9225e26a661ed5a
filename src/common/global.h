#ifndef SHARDCAST_COMMON_GLOBAL_H_
#define SHARDCAST_COMMON_GLOBAL_H_

#include <cstddef>
#include <cstdint>

namespace Shardcast {

/**
 * Server-wide bookkeeping owned by the single I/O path.
 * Workers never touch it, so the fields are plain integers.
 */
struct Global {
    uint64_t tick = 0;

    // Filled by ServerDef::WriteAll
    uint64_t writes_queued = 0;
    uint64_t bytes_queued = 0;

    int32_t compression_threshold = -1;
};

} // namespace Shardcast

#endif // SHARDCAST_COMMON_GLOBAL_H_
