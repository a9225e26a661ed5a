#include "decoder.h"

#include <glog/logging.h>

#include "common/config.h"

namespace Shardcast {

const char* DecodeStatusName(DecodeStatus status) {
	switch (status) {
		case DecodeStatus::kOk: return "ok";
		case DecodeStatus::kIncomplete: return "incomplete";
		case DecodeStatus::kMalformed: return "malformed frame";
		case DecodeStatus::kTooLarge: return "frame too large";
	}
	return "unknown";
}

void PacketDecoder::QueueBytes(const uint8_t* data, size_t len) {
	Compact();
	buf_.insert(buf_.end(), data, data + len);
}

void PacketDecoder::Clear() {
	buf_.clear();
	read_pos_ = 0;
}

void PacketDecoder::Compact() {
	if (read_pos_ == 0) return;
	buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
	read_pos_ = 0;
}

DecodeStatus PacketDecoder::TryNextPacket(PacketFrame* frame) {
	const uint8_t* cur = buf_.data() + read_pos_;
	size_t avail = buf_.size() - read_pos_;

	int32_t frame_len = 0;
	size_t prefix = 0;
	switch (varint::Read(cur, avail, &frame_len, &prefix)) {
		case varint::ReadResult::kIncomplete: return DecodeStatus::kIncomplete;
		case varint::ReadResult::kTooLong: return DecodeStatus::kMalformed;
		case varint::ReadResult::kOk: break;
	}
	if (frame_len < 0) return DecodeStatus::kMalformed;
	if (static_cast<size_t>(frame_len) > MAX_PACKET_SIZE) return DecodeStatus::kTooLarge;
	if (avail - prefix < static_cast<size_t>(frame_len)) return DecodeStatus::kIncomplete;

	const uint8_t* payload = cur + prefix;
	size_t payload_len = static_cast<size_t>(frame_len);
	// The whole frame is consumed even if it turns out to be malformed
	read_pos_ += prefix + payload_len;

	const uint8_t* data = payload;
	size_t data_len = payload_len;

	if (threshold_.Enabled()) {
		int32_t uncompressed_len = 0;
		size_t hdr = 0;
		if (varint::Read(payload, payload_len, &uncompressed_len, &hdr) != varint::ReadResult::kOk) {
			return DecodeStatus::kMalformed;
		}
		data = payload + hdr;
		data_len = payload_len - hdr;

		if (uncompressed_len != 0) {
			if (uncompressed_len < threshold_.value) {
				VLOG(1) << "Compressed frame below threshold: " << uncompressed_len;
				return DecodeStatus::kMalformed;
			}
			if (static_cast<size_t>(uncompressed_len) > MAX_PACKET_SIZE) {
				return DecodeStatus::kTooLarge;
			}
			if (!decompressor_.Decompress(data, data_len, static_cast<size_t>(uncompressed_len), &inflated_)) {
				return DecodeStatus::kMalformed;
			}
			data = inflated_.data();
			data_len = inflated_.size();
		}
	}

	int32_t id = 0;
	size_t id_len = 0;
	if (varint::Read(data, data_len, &id, &id_len) != varint::ReadResult::kOk) {
		return DecodeStatus::kMalformed;
	}

	frame->id = id;
	frame->body = data + id_len;
	frame->body_len = data_len - id_len;
	return DecodeStatus::kOk;
}

} // namespace Shardcast
