#include "io_buf.h"

#include <vector>

#include <glog/logging.h>

#include "server.h"

namespace Shardcast {

IoBuf::IoBuf(CompressionThreshold threshold, size_t index, size_t capacity)
	: enc_(threshold),
	  buf_(capacity),
	  index_(index) {
}

IoBufs::IoBufs(CompressionThreshold threshold, size_t num_shards, size_t capacity)
	: locals_(num_shards, [threshold, capacity](size_t i) { return IoBuf(threshold, i, capacity); }) {
}

IoBufs IoBufs::Init(CompressionThreshold threshold, ServerDef& server,
		size_t num_shards, size_t capacity) {
	IoBufs bufs(threshold, num_shards, capacity);

	std::vector<Ring*> rings;
	rings.reserve(num_shards);
	bufs.locals_.ForEach([&rings](IoBuf& buf) { rings.push_back(&buf.BufMut()); });
	RegisterRings(server, rings);

	LOG(INFO) << "IoBufs initialized: " << num_shards << " shards x "
		<< (capacity / 1024 / 1024) << " MiB, compression threshold " << threshold.value;
	return bufs;
}

void IoBufs::SetCompression(CompressionThreshold threshold) {
	locals_.ForEach([threshold](IoBuf& buf) { buf.EncMut().SetCompression(threshold); });
}

} // namespace Shardcast
