#include "outbound_queue.h"

#include <glog/logging.h>

namespace Shardcast {

void OutboundQueue::Push(const PacketWriteInfo& info) {
	if (info.len == 0) {
		// Still owes a completion; keep it so accounting lines up
		entries_.push_back({info.start_ptr, 0, 0});
		return;
	}
	entries_.push_back({info.start_ptr, info.len, 0});
	pending_bytes_ += info.len;
}

size_t OutboundQueue::BuildIov(struct iovec* iov, size_t max_iov, size_t* bytes) const {
	size_t n = 0;
	size_t total = 0;
	for (const Entry& e : entries_) {
		if (n == max_iov) break;
		if (e.len == e.offset) continue;
		iov[n].iov_base = const_cast<uint8_t*>(e.ptr + e.offset);
		iov[n].iov_len = e.len - e.offset;
		total += iov[n].iov_len;
		n++;
	}
	*bytes = total;
	return n;
}

size_t OutboundQueue::Consume(size_t bytes) {
	DCHECK_LE(bytes, pending_bytes_);
	size_t completed = 0;
	pending_bytes_ -= bytes;

	while (!entries_.empty()) {
		Entry& front = entries_.front();
		size_t remaining = front.len - front.offset;
		if (remaining > bytes) {
			front.offset += static_cast<uint32_t>(bytes);
			break;
		}
		bytes -= remaining;
		entries_.pop_front();
		completed++;
	}
	return completed;
}

void OutboundQueue::Clear() {
	entries_.clear();
	pending_bytes_ = 0;
}

} // namespace Shardcast
