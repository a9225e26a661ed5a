#ifndef SHARDCAST_COMMON_SHARD_POOL_H_
#define SHARDCAST_COMMON_SHARD_POOL_H_

#include <functional>
#include <thread>
#include <vector>

#include <absl/synchronization/mutex.h>

namespace Shardcast {

/**
 * Fixed set of worker threads, one per shard.
 *
 * Worker i calls SetCurrentShard(i) before anything else, so ShardLocal::GetLocal()
 * inside a job always resolves to that worker's own slot. Jobs are run in lock-step:
 * RunOnAllShards() hands the same function to every worker and returns when all of
 * them finished, which keeps the producing phase of a tick separate from the I/O phase.
 */
class ShardPool {
public:
    using Job = std::function<void(size_t shard)>;

    explicit ShardPool(size_t num_shards);
    ~ShardPool();

    ShardPool(const ShardPool&) = delete;
    ShardPool& operator=(const ShardPool&) = delete;

    void RunOnAllShards(const Job& job);

    size_t NumShards() const { return workers_.size(); }

private:
    void WorkerThread(size_t shard);

    std::vector<std::thread> workers_;

    absl::Mutex mu_;
    absl::CondVar work_cv_;
    absl::CondVar done_cv_;
    const Job* job_ ABSL_GUARDED_BY(mu_) = nullptr;
    uint64_t generation_ ABSL_GUARDED_BY(mu_) = 0;
    size_t remaining_ ABSL_GUARDED_BY(mu_) = 0;
    bool stop_ ABSL_GUARDED_BY(mu_) = false;
};

} // namespace Shardcast

#endif // SHARDCAST_COMMON_SHARD_POOL_H_
