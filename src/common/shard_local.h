#ifndef SHARDCAST_COMMON_SHARD_LOCAL_H_
#define SHARDCAST_COMMON_SHARD_LOCAL_H_

#include <cstddef>
#include <memory>
#include <vector>

#include <glog/logging.h>

#include "config.h"

namespace Shardcast {

/**
 * Index of the shard owned by the calling thread.
 * Workers set it once at startup; the I/O path runs as shard 0 while workers are parked.
 */
size_t CurrentShard();
void SetCurrentShard(size_t shard);

/**
 * One value per shard, each on its own cache line.
 *
 * A slot must only be mutated by the thread that owns its shard. Nothing here
 * synchronizes; callers resolve "my slot" through a stable shard index.
 */
template<typename T>
class ShardLocal {
public:
    explicit ShardLocal(size_t num_shards)
        : ShardLocal(num_shards, [](size_t) { return T(); }) {}

    template<typename Init>
    ShardLocal(size_t num_shards, Init init) {
        CHECK_GT(num_shards, 0u) << "ShardLocal needs at least one shard";
        slots_.reserve(num_shards);
        for (size_t i = 0; i < num_shards; ++i) {
            slots_.push_back(std::make_unique<Slot>(i, init));
        }
    }

    ShardLocal(const ShardLocal&) = delete;
    ShardLocal& operator=(const ShardLocal&) = delete;
    ShardLocal(ShardLocal&&) = default;
    ShardLocal& operator=(ShardLocal&&) = default;

    size_t size() const { return slots_.size(); }

    T& Get(size_t shard) {
        DCHECK_LT(shard, slots_.size());
        return slots_[shard]->value;
    }
    const T& Get(size_t shard) const {
        DCHECK_LT(shard, slots_.size());
        return slots_[shard]->value;
    }

    T& GetLocal() { return Get(CurrentShard()); }
    const T& GetLocal() const { return Get(CurrentShard()); }

    template<typename F>
    void ForEach(F&& f) {
        for (auto& slot : slots_) f(slot->value);
    }
    template<typename F>
    void ForEach(F&& f) const {
        for (const auto& slot : slots_) f(slot->value);
    }

private:
    struct alignas(CACHELINE_SIZE) Slot {
        template<typename Init>
        Slot(size_t index, Init& init) : value(init(index)) {}
        T value;
    };

    std::vector<std::unique_ptr<Slot>> slots_;
};

} // namespace Shardcast

#endif // SHARDCAST_COMMON_SHARD_LOCAL_H_
