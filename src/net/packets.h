#ifndef SHARDCAST_NET_PACKETS_H_
#define SHARDCAST_NET_PACKETS_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>

#include <absl/cleanup/cleanup.h>
#include <glog/logging.h>

#include "common/shard_local.h"
#include "encoder.h"
#include "io_buf.h"

namespace Shardcast {

/**
 * Outbound queue for one target (a connection, or the Broadcast).
 *
 * Each shard has its own ordered list of ring regions; insertion order is send
 * order. Shard i's list is only written by the thread owning shard i, and only
 * read by the I/O path after PrepareForSend(), in a separate tick phase.
 *
 * number_sending_ is the only field shared across threads. It is non-zero
 * exactly while a batch is in flight:
 *   Idle --PrepareForSend()--> Sending --SetSuccessfullySent()...--> Idle
 * Appending is allowed in both states.
 */
class Packets {
public:
    using WriteQueue = std::deque<PacketWriteInfo>;

    explicit Packets(size_t num_shards) : to_write_(num_shards) {}

    Packets(const Packets&) = delete;
    Packets& operator=(const Packets&) = delete;

    /// Append other's regions shard-for-shard, keeping their order.
    void Extend(const Packets& other);

    ShardLocal<WriteQueue>& GetWriteMut() { return to_write_; }
    const ShardLocal<WriteQueue>& GetWrite() const { return to_write_; }

    /// No batch in flight and at least one shard has something queued.
    bool CanSend() const { return !IsSending() && HasPending(); }

    bool IsSending() const { return number_sending_.load(std::memory_order_relaxed) != 0; }
    bool HasPending() const;
    size_t PendingCount() const;
    size_t NumberSending() const { return number_sending_.load(std::memory_order_relaxed); }

    /**
     * Move from accumulating to in flight.
     * @param trailing Queue written to the same connection in this batch right
     *        after ours (the broadcast); its entries are counted too since each
     *        of them produces a completion for this connection.
     * @return The number of completions to expect.
     */
    size_t PrepareForSend(const Packets* trailing = nullptr);

    /// Account for n completed writes. Reporting more than are in flight is fatal.
    void SetSuccessfullySent(size_t n);

    void Clear();

    /**
     * Encode pkt on the caller's shard using the shard's current threshold.
     * On error the queue is unchanged and the status is returned.
     */
    template<typename P>
    EncodeStatus Append(const P& pkt, Compose& compose) {
        IoBuf& buf = compose.bufs.GetLocal();
        Scratch& scratch = compose.scratch.GetLocal();
        Compressor& compressor = compose.compressor.GetLocal();

        PacketWriteInfo info;
        EncodeStatus status = buf.EncMut().AppendPacket(pkt, buf.BufMut(), scratch, compressor, &info);
        if (status != EncodeStatus::kOk) return status;

        Push(info, buf);
        return EncodeStatus::kOk;
    }

    /**
     * Encode pkt without compression, e.g. packets sent before the peer knows the
     * threshold. The buffer's threshold is restored on every exit path.
     * Rare enough that it uses its own scratch instead of the shard's.
     */
    template<typename P>
    EncodeStatus AppendPreCompressionPacket(const P& pkt, IoBuf& buf) {
        const CompressionThreshold compression = buf.Enc().compression_threshold();
        buf.EncMut().SetCompression(CompressionThreshold{});
        absl::Cleanup restore = [&buf, compression] { buf.EncMut().SetCompression(compression); };

        Scratch scratch;
        PacketWriteInfo info;
        EncodeStatus status = AppendPacketWithoutCompression(pkt, buf.BufMut(), scratch, &info);
        if (status != EncodeStatus::kOk) return status;

        VLOG(3) << "without compression: ptr=" << static_cast<void*>(info.start_ptr)
            << " len=" << info.len;
        Push(info, buf);
        return EncodeStatus::kOk;
    }

    /// Copy already-framed bytes straight into the ring.
    void AppendRaw(const uint8_t* data, size_t len, IoBuf& buf);

private:
    void Push(const PacketWriteInfo& writer, const IoBuf& buf);

    ShardLocal<WriteQueue> to_write_;
    std::atomic<size_t> number_sending_{0};
};

/**
 * The server-wide queue. A distinct type so it cannot be confused with a
 * connection's own Packets; exactly one is created by the server loop.
 */
class Broadcast : public Packets {
public:
    using Packets::Packets;
};

} // namespace Shardcast

#endif // SHARDCAST_NET_PACKETS_H_
