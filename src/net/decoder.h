#ifndef SHARDCAST_NET_DECODER_H_
#define SHARDCAST_NET_DECODER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "compressor.h"
#include "packet.h"

namespace Shardcast {

enum class DecodeStatus {
    kOk,
    kIncomplete,   // need more bytes
    kMalformed,    // bad VarInt, bad compression header or inflate failure
    kTooLarge,     // declared frame above MAX_PACKET_SIZE
};

const char* DecodeStatusName(DecodeStatus status);

/**
 * Decoded frame. body points into the decoder and is valid until the next
 * TryNextPacket() or QueueBytes() call.
 */
struct PacketFrame {
    int32_t id = 0;
    const uint8_t* body = nullptr;
    size_t body_len = 0;
};

/**
 * Reassembles inbound frames from a connection's byte stream.
 * Understands both the plain and the compressed frame layout.
 */
class PacketDecoder {
public:
    explicit PacketDecoder(CompressionThreshold threshold = CompressionThreshold{})
        : threshold_(threshold) {}

    void QueueBytes(const uint8_t* data, size_t len);

    DecodeStatus TryNextPacket(PacketFrame* frame);

    CompressionThreshold compression_threshold() const { return threshold_; }
    void SetCompression(CompressionThreshold threshold) { threshold_ = threshold; }

    size_t Buffered() const { return buf_.size() - read_pos_; }
    void Clear();

private:
    void Compact();

    CompressionThreshold threshold_;
    std::vector<uint8_t> buf_;
    size_t read_pos_ = 0;
    std::vector<uint8_t> inflated_;
    Decompressor decompressor_;
};

} // namespace Shardcast

#endif // SHARDCAST_NET_DECODER_H_
