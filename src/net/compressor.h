#ifndef SHARDCAST_NET_COMPRESSOR_H_
#define SHARDCAST_NET_COMPRESSOR_H_

#include <cstddef>
#include <cstdint>
#include <vector>
#include <zlib.h>

#include "common/shard_local.h"

namespace Shardcast {

/**
 * Reusable zlib deflate stream. Output lands in Output() and is valid until the
 * next Compress() call.
 */
class Compressor {
public:
    explicit Compressor(int level);
    ~Compressor();

    Compressor(const Compressor&) = delete;
    Compressor& operator=(const Compressor&) = delete;

    bool Compress(const uint8_t* data, size_t len);

    const std::vector<uint8_t>& Output() const { return output_; }
    int Level() const { return level_; }

private:
    z_stream stream_;
    int level_;
    std::vector<uint8_t> output_;
};

/**
 * Reusable zlib inflate stream for inbound frames.
 */
class Decompressor {
public:
    Decompressor();
    ~Decompressor();

    Decompressor(const Decompressor&) = delete;
    Decompressor& operator=(const Decompressor&) = delete;

    /// Inflate exactly expected_len bytes into *out; anything else is an error.
    bool Decompress(const uint8_t* data, size_t len, size_t expected_len, std::vector<uint8_t>* out);

private:
    z_stream stream_;
};

/**
 * One compressor per shard so workers never share a z_stream.
 */
class Compressors {
public:
    Compressors(size_t num_shards, int level)
        : compressors_(num_shards, [level](size_t) { return Compressor(level); }) {}

    Compressor& GetLocal() { return compressors_.GetLocal(); }
    Compressor& Get(size_t shard) { return compressors_.Get(shard); }
    size_t size() const { return compressors_.size(); }

private:
    ShardLocal<Compressor> compressors_;
};

} // namespace Shardcast

#endif // SHARDCAST_NET_COMPRESSOR_H_
