#ifndef SHARDCAST_NET_ENCODER_H_
#define SHARDCAST_NET_ENCODER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "common/shard_local.h"
#include "packet.h"
#include "ring.h"

namespace Shardcast {

class Compressor;

enum class EncodeStatus {
    kOk,
    kMalformed,          // packet refused to serialize
    kPacketTooLarge,     // frame would exceed MAX_PACKET_SIZE
    kCompressionFailed,
};

const char* EncodeStatusName(EncodeStatus status);

/**
 * A region of a shard's Ring holding one or more complete frames.
 *
 * Borrowed from the ring: [start_ptr, start_ptr + len) is valid until the ring
 * wraps past it. epoch is the ring's Epoch() when the region was written;
 * regions from different epochs are never coalesced.
 */
struct PacketWriteInfo {
    uint8_t* start_ptr = nullptr;
    uint32_t len = 0;
    uint32_t epoch = 0;
};

/**
 * Per-shard scratch space reused across packets.
 */
struct Scratch {
    std::vector<uint8_t> body;
    std::vector<uint8_t> frame;
};

class Scratches {
public:
    explicit Scratches(size_t num_shards) : scratches_(num_shards) {}

    Scratch& GetLocal() { return scratches_.GetLocal(); }
    Scratch& Get(size_t shard) { return scratches_.Get(shard); }

private:
    ShardLocal<Scratch> scratches_;
};

namespace detail {

// Serializes "id body" into scratch->body
template<typename P>
bool EncodeBody(const P& pkt, Scratch* scratch) {
    scratch->body.clear();
    varint::Append(pkt.Id(), &scratch->body);
    return pkt.Encode(&scratch->body);
}

// Frames scratch->body according to threshold and copies the frame into ring
EncodeStatus WriteFrame(CompressionThreshold threshold, Ring& ring, Scratch& scratch,
                        Compressor* compressor, PacketWriteInfo* info);

} // namespace detail

/**
 * Turns packets into length-prefixed (optionally deflated) frames inside a Ring.
 */
class PacketEncoder {
public:
    explicit PacketEncoder(CompressionThreshold threshold) : threshold_(threshold) {}

    CompressionThreshold compression_threshold() const { return threshold_; }
    void SetCompression(CompressionThreshold threshold) { threshold_ = threshold; }

    /**
     * Encode pkt with the current threshold and append the frame to ring.
     * On any error the ring is left untouched and *info is not written.
     */
    template<typename P>
    EncodeStatus AppendPacket(const P& pkt, Ring& ring, Scratch& scratch,
                              Compressor& compressor, PacketWriteInfo* info) const {
        if (!detail::EncodeBody(pkt, &scratch)) return EncodeStatus::kMalformed;
        return detail::WriteFrame(threshold_, ring, scratch, &compressor, info);
    }

private:
    CompressionThreshold threshold_;
};

/**
 * Append pkt using the uncompressed frame layout regardless of any encoder state.
 */
template<typename P>
EncodeStatus AppendPacketWithoutCompression(const P& pkt, Ring& ring, Scratch& scratch,
                                            PacketWriteInfo* info) {
    if (!detail::EncodeBody(pkt, &scratch)) return EncodeStatus::kMalformed;
    return detail::WriteFrame(CompressionThreshold{}, ring, scratch, nullptr, info);
}

} // namespace Shardcast

#endif // SHARDCAST_NET_ENCODER_H_
