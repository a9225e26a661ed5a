#include "shard_pool.h"

#include <glog/logging.h>

#include "shard_local.h"

namespace Shardcast {

namespace {
thread_local size_t current_shard = 0;
} // namespace

size_t CurrentShard() {
	return current_shard;
}

void SetCurrentShard(size_t shard) {
	current_shard = shard;
}

ShardPool::ShardPool(size_t num_shards) {
	CHECK_GT(num_shards, 0u) << "ShardPool needs at least one shard";
	workers_.reserve(num_shards);
	for (size_t i = 0; i < num_shards; ++i) {
		workers_.emplace_back(&ShardPool::WorkerThread, this, i);
	}
	VLOG(1) << "ShardPool started with " << num_shards << " workers";
}

ShardPool::~ShardPool() {
	{
		absl::MutexLock lock(&mu_);
		stop_ = true;
		work_cv_.SignalAll();
	}
	for (auto& t : workers_) {
		if (t.joinable()) t.join();
	}
}

void ShardPool::RunOnAllShards(const Job& job) {
	absl::MutexLock lock(&mu_);
	CHECK(job_ == nullptr) << "RunOnAllShards is not reentrant";
	job_ = &job;
	remaining_ = workers_.size();
	generation_++;
	work_cv_.SignalAll();
	while (remaining_ > 0) {
		done_cv_.Wait(&mu_);
	}
	job_ = nullptr;
}

void ShardPool::WorkerThread(size_t shard) {
	SetCurrentShard(shard);
	uint64_t seen_generation = 0;

	while (true) {
		const Job* job = nullptr;
		{
			absl::MutexLock lock(&mu_);
			while (!stop_ && generation_ == seen_generation) {
				work_cv_.Wait(&mu_);
			}
			if (stop_) return;
			seen_generation = generation_;
			job = job_;
		}

		(*job)(shard);

		absl::MutexLock lock(&mu_);
		if (--remaining_ == 0) {
			done_cv_.Signal();
		}
	}
}

} // namespace Shardcast
