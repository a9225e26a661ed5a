#include "encoder.h"

#include <glog/logging.h>

#include "common/config.h"
#include "compressor.h"

namespace Shardcast {

const char* EncodeStatusName(EncodeStatus status) {
	switch (status) {
		case EncodeStatus::kOk: return "ok";
		case EncodeStatus::kMalformed: return "malformed packet";
		case EncodeStatus::kPacketTooLarge: return "packet too large";
		case EncodeStatus::kCompressionFailed: return "compression failed";
	}
	return "unknown";
}

namespace detail {

EncodeStatus WriteFrame(CompressionThreshold threshold, Ring& ring, Scratch& scratch,
		Compressor* compressor, PacketWriteInfo* info) {
	const std::vector<uint8_t>& body = scratch.body;
	std::vector<uint8_t>& frame = scratch.frame;
	frame.clear();

	if (body.size() > MAX_PACKET_SIZE) {
		VLOG(1) << "Refusing packet body of " << body.size() << " bytes";
		return EncodeStatus::kPacketTooLarge;
	}
	const int32_t body_len = static_cast<int32_t>(body.size());

	if (!threshold.Enabled()) {
		// VarInt(len) id body
		varint::Append(body_len, &frame);
		frame.insert(frame.end(), body.begin(), body.end());
	} else if (body_len >= threshold.value) {
		// VarInt(len) VarInt(uncompressed len) zlib(id body)
		if (compressor == nullptr || !compressor->Compress(body.data(), body.size())) {
			return EncodeStatus::kCompressionFailed;
		}
		const std::vector<uint8_t>& compressed = compressor->Output();
		size_t inner_len = varint::EncodedSize(static_cast<uint32_t>(body_len)) + compressed.size();
		if (inner_len > MAX_PACKET_SIZE) {
			return EncodeStatus::kPacketTooLarge;
		}
		varint::Append(static_cast<int32_t>(inner_len), &frame);
		varint::Append(body_len, &frame);
		frame.insert(frame.end(), compressed.begin(), compressed.end());
	} else {
		// VarInt(len + 1) 0x00 id body
		if (body.size() + 1 > MAX_PACKET_SIZE) {
			VLOG(1) << "Refusing packet body of " << body.size() << " bytes";
			return EncodeStatus::kPacketTooLarge;
		}
		varint::Append(body_len + 1, &frame);
		frame.push_back(0);
		frame.insert(frame.end(), body.begin(), body.end());
	}

	info->start_ptr = ring.Append(frame.data(), frame.size());
	info->len = static_cast<uint32_t>(frame.size());
	info->epoch = static_cast<uint32_t>(ring.Epoch());
	return EncodeStatus::kOk;
}

} // namespace detail

} // namespace Shardcast
