#ifndef SHARDCAST_NET_IO_BUF_H_
#define SHARDCAST_NET_IO_BUF_H_

#include <cstddef>

#include "common/config.h"
#include "common/shard_local.h"
#include "compressor.h"
#include "encoder.h"
#include "ring.h"

namespace Shardcast {

class ServerDef;

/**
 * One shard's outbound state: the encoder and the ring it writes into.
 * Only the thread owning shard Index() may touch it.
 */
class IoBuf {
public:
    IoBuf(CompressionThreshold threshold, size_t index, size_t capacity = S2C_BUFFER_SIZE);

    IoBuf(const IoBuf&) = delete;
    IoBuf& operator=(const IoBuf&) = delete;

    const PacketEncoder& Enc() const { return enc_; }
    PacketEncoder& EncMut() { return enc_; }

    size_t Index() const { return index_; }

    Ring& BufMut() { return buf_; }
    const Ring& Buf() const { return buf_; }

private:
    PacketEncoder enc_;
    Ring buf_;
    size_t index_;
};

/**
 * All shards' IoBufs. Built once at startup; the ring mappings are registered
 * with the event loop before anything can be appended to them.
 */
class IoBufs {
public:
    static IoBufs Init(CompressionThreshold threshold, ServerDef& server,
                       size_t num_shards, size_t capacity = S2C_BUFFER_SIZE);

    IoBufs(IoBufs&&) = default;
    IoBufs& operator=(IoBufs&&) = default;

    IoBuf& GetLocal() { return locals_.GetLocal(); }
    IoBuf& Get(size_t shard) { return locals_.Get(shard); }
    size_t size() const { return locals_.size(); }

    /// Change every shard's threshold (I/O path only, while workers are parked).
    void SetCompression(CompressionThreshold threshold);

private:
    IoBufs(CompressionThreshold threshold, size_t num_shards, size_t capacity);

    ShardLocal<IoBuf> locals_;
};

/**
 * What Packets::Append needs to encode on the caller's shard.
 */
struct Compose {
    IoBufs& bufs;
    Compressors& compressor;
    Scratches& scratch;
};

} // namespace Shardcast

#endif // SHARDCAST_NET_IO_BUF_H_
