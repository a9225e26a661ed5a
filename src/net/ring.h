#ifndef SHARDCAST_NET_RING_H_
#define SHARDCAST_NET_RING_H_

#include <cstddef>
#include <cstdint>
#include <vector>
#include <sys/uio.h>

namespace Shardcast {

class ServerDef;

/**
 * Append-only byte ring backing one shard's outbound data.
 *
 * Pointers returned by Append() stay valid until the head wraps around and
 * overwrites them. The mapping never moves, so its address can be registered
 * with the event loop once at startup.
 */
class Ring {
public:
    explicit Ring(size_t capacity);
    ~Ring();

    Ring(const Ring&) = delete;
    Ring& operator=(const Ring&) = delete;

    /**
     * Copy len bytes into the ring
     * @return Start of the copy. If the bytes do not fit before the end of the
     *         mapping the head restarts at offset 0 and Epoch() advances.
     */
    uint8_t* Append(const uint8_t* data, size_t len);

    uint64_t Epoch() const { return epoch_; }
    size_t Capacity() const { return capacity_; }
    size_t Head() const { return head_; }
    const uint8_t* Data() const { return base_; }

    struct iovec AsIovec() const;

private:
    uint8_t* base_ = nullptr;
    size_t capacity_;
    size_t head_ = 0;
    uint64_t epoch_ = 0;
};

/**
 * Hand every ring to the event loop in a single AllocateBuffers() call.
 */
void RegisterRings(ServerDef& server, const std::vector<Ring*>& rings);

} // namespace Shardcast

#endif // SHARDCAST_NET_RING_H_
