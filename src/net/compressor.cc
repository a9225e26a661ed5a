#include "compressor.h"

#include <cstring>

#include <glog/logging.h>

namespace Shardcast {

Compressor::Compressor(int level) : level_(level) {
	std::memset(&stream_, 0, sizeof(stream_));
	stream_.zalloc = Z_NULL;
	stream_.zfree = Z_NULL;
	stream_.opaque = Z_NULL;
	int ret = deflateInit(&stream_, level_);
	if (ret != Z_OK) {
		LOG(FATAL) << "deflateInit(level=" << level_ << ") failed: " << ret;
	}
}

Compressor::~Compressor() {
	deflateEnd(&stream_);
}

bool Compressor::Compress(const uint8_t* data, size_t len) {
	if (deflateReset(&stream_) != Z_OK) {
		LOG(ERROR) << "deflateReset failed";
		return false;
	}

	output_.resize(deflateBound(&stream_, static_cast<uLong>(len)));

	stream_.next_in = const_cast<Bytef*>(data);
	stream_.avail_in = static_cast<uInt>(len);
	stream_.next_out = output_.data();
	stream_.avail_out = static_cast<uInt>(output_.size());

	int ret = deflate(&stream_, Z_FINISH);
	if (ret != Z_STREAM_END) {
		LOG(ERROR) << "deflate failed: " << ret << " input_len=" << len;
		output_.clear();
		return false;
	}

	output_.resize(stream_.total_out);
	return true;
}

Decompressor::Decompressor() {
	std::memset(&stream_, 0, sizeof(stream_));
	stream_.zalloc = Z_NULL;
	stream_.zfree = Z_NULL;
	stream_.opaque = Z_NULL;
	int ret = inflateInit(&stream_);
	if (ret != Z_OK) {
		LOG(FATAL) << "inflateInit failed: " << ret;
	}
}

Decompressor::~Decompressor() {
	inflateEnd(&stream_);
}

bool Decompressor::Decompress(const uint8_t* data, size_t len, size_t expected_len,
		std::vector<uint8_t>* out) {
	if (inflateReset(&stream_) != Z_OK) {
		LOG(ERROR) << "inflateReset failed";
		return false;
	}

	out->resize(expected_len);

	stream_.next_in = const_cast<Bytef*>(data);
	stream_.avail_in = static_cast<uInt>(len);
	stream_.next_out = out->data();
	stream_.avail_out = static_cast<uInt>(out->size());

	int ret = inflate(&stream_, Z_FINISH);
	if (ret != Z_STREAM_END || stream_.total_out != expected_len) {
		VLOG(1) << "inflate failed: ret=" << ret << " input_len=" << len
			<< " inflated=" << stream_.total_out << " expected=" << expected_len;
		out->clear();
		return false;
	}
	return true;
}

} // namespace Shardcast
