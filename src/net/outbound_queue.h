#ifndef SHARDCAST_NET_OUTBOUND_QUEUE_H_
#define SHARDCAST_NET_OUTBOUND_QUEUE_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <sys/uio.h>

#include "encoder.h"

namespace Shardcast {

/**
 * Regions accepted by WriteAll() for one connection but not yet fully written.
 * Both backends drain it with scatter-gather sends.
 */
class OutboundQueue {
public:
    void Push(const PacketWriteInfo& info);

    bool Empty() const { return entries_.empty(); }
    size_t Size() const { return entries_.size(); }
    size_t PendingBytes() const { return pending_bytes_; }

    /**
     * Fill up to max_iov iovecs starting at the first unsent byte.
     * @return Number of iovecs written; *bytes receives their total length
     */
    size_t BuildIov(struct iovec* iov, size_t max_iov, size_t* bytes) const;

    /**
     * Mark bytes as written.
     * @return Number of regions that are now completely written
     */
    size_t Consume(size_t bytes);

    void Clear();

private:
    struct Entry {
        const uint8_t* ptr;
        uint32_t len;
        uint32_t offset;
    };

    std::deque<Entry> entries_;
    size_t pending_bytes_ = 0;
};

} // namespace Shardcast

#endif // SHARDCAST_NET_OUTBOUND_QUEUE_H_
