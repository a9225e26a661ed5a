#include "game_server.h"

#include <string>
#include <algorithm>
#include <type_traits>
#include <variant>

#include <glog/logging.h>

#include "net/packet.h"

namespace Shardcast {

namespace {

// Serverbound play packet ids
constexpr int32_t kServerboundChat = 0x05;
constexpr int32_t kServerboundKeepAlive = 0x12;

bool ReadString(const std::vector<uint8_t>& body, std::string* out) {
	int32_t len = 0;
	size_t consumed = 0;
	if (varint::Read(body.data(), body.size(), &len, &consumed) != varint::ReadResult::kOk) {
		return false;
	}
	if (len < 0 || static_cast<size_t>(len) > ChatMessage::kMaxLength ||
			consumed + static_cast<size_t>(len) > body.size()) {
		return false;
	}
	out->assign(reinterpret_cast<const char*>(body.data() + consumed), static_cast<size_t>(len));
	return true;
}

bool ReadLong(const std::vector<uint8_t>& body, int64_t* out) {
	if (body.size() < 8) return false;
	uint64_t value = 0;
	for (size_t i = 0; i < 8; ++i) {
		value = (value << 8) | body[i];
	}
	*out = static_cast<int64_t>(value);
	return true;
}

} // namespace

GameServerOptions GameServerOptions::FromConfiguration(const Configuration& config) {
	const ShardcastConfig& c = config.config();
	GameServerOptions options;
	options.address = config.getAddress();
	options.num_shards = config.getNumShards();
	options.ring_buffer_size = config.getRingBufferSize();
	options.threshold = CompressionThreshold{config.getCompressionThreshold()};
	options.compression_level = c.compression.level.get();
	options.keepalive_ticks = static_cast<uint64_t>(std::max(c.server.keepalive_ticks.get(), 0));
	options.server.max_events = c.network.max_events.get();
	options.server.zero_copy = c.network.zero_copy.get();
	options.server.zerocopy_min_bytes = c.network.zerocopy_min_bytes.get();
	options.server.pin_buffers = c.network.pin_buffers.get();
	options.server.recv_buffer_size = c.network.recv_buffer_size.get();
	return options;
}

GameServer::GameServer(const GameServerOptions& options)
	: options_(options),
	  pool_(options.num_shards),
	  server_(std::make_unique<Server>(options.address, options.server)),
	  bufs_(IoBufs::Init(options.threshold, *server_, options.num_shards, options.ring_buffer_size)),
	  compressors_(options.num_shards, options.compression_level),
	  scratches_(options.num_shards),
	  broadcast_(options.num_shards) {
	global_.compression_threshold = options.threshold.value;
	LOG(INFO) << "GameServer started: " << options.num_shards << " shards, protocol "
		<< PROTOCOL_VERSION << " (" << MINECRAFT_VERSION << ")";
}

GameServer::~GameServer() {
	LOG(INFO) << "GameServer stopping after " << global_.tick << " ticks, "
		<< global_.writes_queued << " writes / " << global_.bytes_queued << " bytes queued";
}

bool GameServer::Tick() {
	// The I/O path appends on shard 0 while the workers are parked
	SetCurrentShard(0);

	if (!server_->Drain([this](const ServerEvent& event) { HandleEvent(event); })) {
		return false;
	}

	RunGamePhase();
	Egress();

	global_.tick++;
	return true;
}

void GameServer::HandleEvent(const ServerEvent& event) {
	std::visit([this](const auto& e) {
		using T = std::decay_t<decltype(e)>;
		if constexpr (std::is_same_v<T, AddPlayer>) {
			OnAddPlayer(e.fd);
		} else if constexpr (std::is_same_v<T, RemovePlayer>) {
			VLOG(1) << "Player " << e.fd.value() << " left";
			players_.erase(e.fd);
		} else if constexpr (std::is_same_v<T, RecvData>) {
			OnRecvData(e.fd, e.data, e.len);
		} else {
			OnSentData(e.fd);
		}
	}, event);
}

void GameServer::OnAddPlayer(Fd fd) {
	const size_t shard = next_shard_++ % options_.num_shards;
	auto player = std::make_unique<Player>(options_.num_shards, shard, options_.threshold);

	if (options_.threshold.Enabled()) {
		EncodeStatus status = player->packets->AppendPreCompressionPacket(
				SetCompression{options_.threshold.value}, bufs_.Get(0));
		if (status != EncodeStatus::kOk) {
			LOG(ERROR) << "Failed to queue SetCompression for " << fd.value() << ": "
				<< EncodeStatusName(status);
		}
	}

	VLOG(1) << "Player " << fd.value() << " joined on shard " << shard;
	players_[fd] = std::move(player);
}

void GameServer::OnRecvData(Fd fd, const uint8_t* data, size_t len) {
	auto it = players_.find(fd);
	if (it == players_.end()) return;
	Player& player = *it->second;
	if (player.broken) return;

	player.decoder.QueueBytes(data, len);
	while (true) {
		PacketFrame frame;
		DecodeStatus status = player.decoder.TryNextPacket(&frame);
		if (status == DecodeStatus::kIncomplete) break;
		if (status != DecodeStatus::kOk) {
			LOG(WARNING) << "Dropping input from player " << fd.value() << ": " << DecodeStatusName(status);
			player.broken = true;
			player.decoder.Clear();
			player.inbound.clear();
			break;
		}
		player.inbound.push_back({frame.id, std::vector<uint8_t>(frame.body, frame.body + frame.body_len)});
	}
}

void GameServer::OnSentData(Fd fd) {
	auto it = players_.find(fd);
	if (it == players_.end()) {
		VLOG(2) << "SentData for departed player " << fd.value();
		return;
	}
	it->second->packets->SetSuccessfullySent(1);
}

void GameServer::ProcessInbound(Player& player, Compose& compose) {
	for (const InboundPacket& packet : player.inbound) {
		switch (packet.id) {
		case kServerboundChat: {
			ChatMessage chat;
			if (!ReadString(packet.body, &chat.text)) {
				VLOG(1) << "Malformed chat packet";
				break;
			}
			EncodeStatus status = broadcast_.Append(chat, compose);
			if (status != EncodeStatus::kOk) {
				LOG(WARNING) << "Chat broadcast failed: " << EncodeStatusName(status);
			}
			break;
		}
		case kServerboundKeepAlive: {
			KeepAlive reply;
			if (!ReadLong(packet.body, &reply.id)) break;
			EncodeStatus status = player.packets->Append(reply, compose);
			if (status != EncodeStatus::kOk) {
				LOG(WARNING) << "KeepAlive reply failed: " << EncodeStatusName(status);
			}
			break;
		}
		default:
			VLOG(3) << "Ignoring packet id 0x" << std::hex << packet.id;
			break;
		}
	}
	player.inbound.clear();
}

void GameServer::RunGamePhase() {
	const bool send_keepalive = options_.keepalive_ticks > 0 && global_.tick % options_.keepalive_ticks == 0;
	const int64_t keepalive_id = static_cast<int64_t>(global_.tick);

	pool_.RunOnAllShards([&](size_t shard) {
		Compose compose{bufs_, compressors_, scratches_};
		for (auto& [fd, player] : players_) {
			if (player->shard != shard) continue;
			ProcessInbound(*player, compose);
		}

		if (shard == 0 && send_keepalive && !players_.empty()) {
			EncodeStatus status = broadcast_.Append(KeepAlive{keepalive_id}, compose);
			if (status != EncodeStatus::kOk) {
				LOG(WARNING) << "KeepAlive broadcast failed: " << EncodeStatusName(status);
			}
		}
	});
}

void GameServer::Egress() {
	const bool has_broadcast = broadcast_.HasPending();

	std::vector<RefreshItems> items;
	std::vector<Fd> flushed;
	items.reserve(players_.size() * 2);

	for (auto& [fd, player] : players_) {
		Packets& packets = *player->packets;
		if (packets.IsSending()) {
			// Still waiting on the previous batch; keep the broadcast for next time
			if (has_broadcast) packets.Extend(broadcast_);
			continue;
		}
		if (!packets.HasPending() && !has_broadcast) continue;

		size_t expected = packets.PrepareForSend(has_broadcast ? &broadcast_ : nullptr);
		VLOG(3) << "Flushing " << expected << " regions to " << fd.value();
		items.push_back({&packets.GetWriteMut(), fd});
		flushed.push_back(fd);
	}

	// Own queues first, then the broadcast, per connection
	if (has_broadcast) {
		for (const Fd& fd : flushed) {
			items.push_back({&broadcast_.GetWriteMut(), fd});
		}
	}

	if (!items.empty()) {
		server_->WriteAll(global_, items);
	}
	server_->SubmitEvents();

	for (const Fd& fd : flushed) {
		players_[fd]->packets->Clear();
	}
	broadcast_.Clear();
}

} // namespace Shardcast
