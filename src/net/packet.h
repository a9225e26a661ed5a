#ifndef SHARDCAST_NET_PACKET_H_
#define SHARDCAST_NET_PACKET_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Shardcast {

/**
 * Bodies of at least this many bytes get deflated. kDisabled turns compression
 * (and the compressed frame layout) off entirely.
 */
struct CompressionThreshold {
    static constexpr int32_t kDisabled = -1;

    int32_t value = kDisabled;

    bool Enabled() const { return value >= 0; }
    bool operator==(const CompressionThreshold& o) const { return value == o.value; }
    bool operator!=(const CompressionThreshold& o) const { return value != o.value; }
};

namespace varint {

constexpr size_t kMaxBytes = 5;

inline size_t EncodedSize(uint32_t value) {
    size_t n = 1;
    while (value >= 0x80) {
        value >>= 7;
        n++;
    }
    return n;
}

/// Writes value as LEB128 into out (at least kMaxBytes long), returns bytes written.
inline size_t Write(int32_t v, uint8_t* out) {
    uint32_t value = static_cast<uint32_t>(v);
    size_t n = 0;
    while (value >= 0x80) {
        out[n++] = static_cast<uint8_t>(value | 0x80);
        value >>= 7;
    }
    out[n++] = static_cast<uint8_t>(value);
    return n;
}

inline void Append(int32_t v, std::vector<uint8_t>* out) {
    uint8_t tmp[kMaxBytes];
    size_t n = Write(v, tmp);
    out->insert(out->end(), tmp, tmp + n);
}

enum class ReadResult { kOk, kIncomplete, kTooLong };

/// Parses a VarInt from [data, data+len). On kOk, *consumed holds its length.
inline ReadResult Read(const uint8_t* data, size_t len, int32_t* value, size_t* consumed) {
    uint32_t result = 0;
    for (size_t i = 0; i < kMaxBytes; ++i) {
        if (i >= len) return ReadResult::kIncomplete;
        uint8_t byte = data[i];
        result |= static_cast<uint32_t>(byte & 0x7F) << (7 * i);
        if ((byte & 0x80) == 0) {
            *value = static_cast<int32_t>(result);
            *consumed = i + 1;
            return ReadResult::kOk;
        }
    }
    return ReadResult::kTooLong;
}

} // namespace varint

/*
 * Outbound packets. Anything with a kId and
 *   bool Encode(std::vector<uint8_t>* out) const
 * can be handed to the encoder; Encode appends the body (without the id).
 */

// Pre-serialized body with an id chosen at runtime
struct RawPacket {
    int32_t id = 0;
    std::vector<uint8_t> body;

    int32_t Id() const { return id; }
    bool Encode(std::vector<uint8_t>* out) const {
        out->insert(out->end(), body.begin(), body.end());
        return true;
    }
};

struct SetCompression {
    static constexpr int32_t kId = 0x03;
    int32_t threshold = CompressionThreshold::kDisabled;

    int32_t Id() const { return kId; }
    bool Encode(std::vector<uint8_t>* out) const {
        varint::Append(threshold, out);
        return true;
    }
};

struct KeepAlive {
    static constexpr int32_t kId = 0x23;
    int64_t id = 0;

    int32_t Id() const { return kId; }
    bool Encode(std::vector<uint8_t>* out) const {
        for (int shift = 56; shift >= 0; shift -= 8) {
            out->push_back(static_cast<uint8_t>(static_cast<uint64_t>(id) >> shift));
        }
        return true;
    }
};

struct ChatMessage {
    static constexpr int32_t kId = 0x64;
    // Protocol strings are capped at 32767 characters
    static constexpr size_t kMaxLength = 32767;
    std::string text;

    int32_t Id() const { return kId; }
    bool Encode(std::vector<uint8_t>* out) const {
        if (text.size() > kMaxLength) return false;
        varint::Append(static_cast<int32_t>(text.size()), out);
        out->insert(out->end(), text.begin(), text.end());
        return true;
    }
};

} // namespace Shardcast

#endif // SHARDCAST_NET_PACKET_H_
