#include "ring.h"

#include <cerrno>
#include <cstring>
#include <sys/mman.h>

#include <glog/logging.h>

#include "server.h"

namespace Shardcast {

Ring::Ring(size_t capacity) : capacity_(capacity) {
	CHECK_GT(capacity_, 0u) << "Ring capacity must be positive";

	void* addr = mmap(nullptr, capacity_, PROT_READ | PROT_WRITE,
			MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
	if (addr == MAP_FAILED) {
		LOG(FATAL) << "Ring: mmap of " << capacity_ << " bytes failed: " << strerror(errno);
	}
	base_ = static_cast<uint8_t*>(addr);
}

Ring::~Ring() {
	if (base_ != nullptr) {
		munmap(base_, capacity_);
	}
}

uint8_t* Ring::Append(const uint8_t* data, size_t len) {
	CHECK_LE(len, capacity_) << "Ring::Append: " << len << " bytes can never fit";

	if (capacity_ - head_ < len) {
		VLOG(2) << "Ring " << static_cast<void*>(base_) << " wraps at head=" << head_
			<< " epoch=" << epoch_;
		head_ = 0;
		epoch_++;
	}

	uint8_t* start = base_ + head_;
	if (len > 0) {
		std::memcpy(start, data, len);
	}
	head_ += len;
	return start;
}

struct iovec Ring::AsIovec() const {
	struct iovec iov;
	iov.iov_base = base_;
	iov.iov_len = capacity_;
	return iov;
}

void RegisterRings(ServerDef& server, const std::vector<Ring*>& rings) {
	std::vector<struct iovec> buffers;
	buffers.reserve(rings.size());
	for (const Ring* ring : rings) {
		buffers.push_back(ring->AsIovec());
	}
	server.AllocateBuffers(buffers);
}

} // namespace Shardcast
