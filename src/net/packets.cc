#include "packets.h"

namespace Shardcast {

void Packets::Extend(const Packets& other) {
	CHECK_EQ(to_write_.size(), other.to_write_.size()) << "Packets::Extend across different shard counts";
	for (size_t i = 0; i < to_write_.size(); ++i) {
		const WriteQueue& src = other.to_write_.Get(i);
		WriteQueue& dst = to_write_.Get(i);
		dst.insert(dst.end(), src.begin(), src.end());
	}
}

bool Packets::HasPending() const {
	bool pending = false;
	to_write_.ForEach([&pending](const WriteQueue& q) { pending |= !q.empty(); });
	return pending;
}

size_t Packets::PendingCount() const {
	size_t count = 0;
	to_write_.ForEach([&count](const WriteQueue& q) { count += q.size(); });
	return count;
}

size_t Packets::PrepareForSend(const Packets* trailing) {
	CHECK_EQ(number_sending_.load(std::memory_order_relaxed), 0u)
		<< "number sending is not 0 even though we are preparing for send";

	size_t count = PendingCount();
	if (trailing != nullptr) {
		count += trailing->PendingCount();
	}
	number_sending_.store(count, std::memory_order_relaxed);
	return count;
}

void Packets::SetSuccessfullySent(size_t n) {
	CHECK_GT(number_sending_.load(std::memory_order_relaxed), 0u)
		<< "somehow number sending is 0 even though we just marked a successful send";

	size_t prev = number_sending_.fetch_sub(n, std::memory_order_relaxed);
	CHECK_GE(prev, n) << "completed " << n << " writes but only " << prev << " were in flight";
}

void Packets::Clear() {
	to_write_.ForEach([](WriteQueue& q) { q.clear(); });
}

void Packets::AppendRaw(const uint8_t* data, size_t len, IoBuf& buf) {
	PacketWriteInfo writer;
	writer.start_ptr = buf.BufMut().Append(data, len);
	writer.len = static_cast<uint32_t>(len);
	writer.epoch = static_cast<uint32_t>(buf.Buf().Epoch());

	Push(writer, buf);
}

void Packets::Push(const PacketWriteInfo& writer, const IoBuf& buf) {
	CHECK_LT(buf.Index(), to_write_.size())
		<< "IoBuf of shard " << buf.Index() << " pushed to Packets with " << to_write_.size() << " shards";
	WriteQueue& to_write = to_write_.Get(buf.Index());

	if (!to_write.empty()) {
		PacketWriteInfo& last = to_write.back();
		// Only the owning shard writes this ring, so nothing can land between
		// two consecutive regions unless the ring wrapped.
		const uint8_t* start_pointer_if_contiguous = last.start_ptr + last.len;
		if (start_pointer_if_contiguous == writer.start_ptr && last.epoch == writer.epoch) {
			last.len += writer.len;
			return;
		}
	}

	to_write.push_back(writer);
}

} // namespace Shardcast
