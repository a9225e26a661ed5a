#ifndef SHARDCAST_SERVER_GAME_SERVER_H_
#define SHARDCAST_SERVER_GAME_SERVER_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "common/configuration.h"
#include "common/global.h"
#include "common/shard_pool.h"
#include "net/compressor.h"
#include "net/decoder.h"
#include "net/encoder.h"
#include "net/event_loop.h"
#include "net/io_buf.h"
#include "net/packets.h"

namespace Shardcast {

struct GameServerOptions {
    std::string address = "0.0.0.0:25565";
    size_t num_shards = 1;
    size_t ring_buffer_size = S2C_BUFFER_SIZE;
    CompressionThreshold threshold{DEFAULT_COMPRESSION_THRESHOLD};
    int compression_level = DEFAULT_COMPRESSION_LEVEL;
    // KeepAlive broadcast period in ticks, 0 disables
    uint64_t keepalive_ticks = 200;
    ServerOptions server;

    static GameServerOptions FromConfiguration(const Configuration& config);
};

/**
 * A serverbound packet waiting for the game phase. The body is copied out of
 * the decoder since the decoder reuses its buffer.
 */
struct InboundPacket {
    int32_t id;
    std::vector<uint8_t> body;
};

struct Player {
    Player(size_t num_shards, size_t shard, CompressionThreshold threshold)
        : packets(std::make_unique<Packets>(num_shards)), decoder(threshold), shard(shard) {}

    std::unique_ptr<Packets> packets;
    PacketDecoder decoder;
    std::vector<InboundPacket> inbound;
    // Worker that runs this player's game logic
    size_t shard;
    // Set once the inbound stream is corrupt; further input is dropped
    bool broken = false;
};

/**
 * The tick loop: drain connection events, run game logic on the shard
 * workers, then flush every connection's queue plus the broadcast.
 *
 * Tick() must be called from a single thread. Workers only run inside
 * RunOnAllShards(), so between phases the calling thread owns everything.
 */
class GameServer {
public:
    explicit GameServer(const GameServerOptions& options);
    ~GameServer();

    GameServer(const GameServer&) = delete;
    GameServer& operator=(const GameServer&) = delete;

    /// One full tick. Returns false if the event loop failed.
    bool Tick();

    uint16_t Port() const { return server_->Port(); }
    size_t NumPlayers() const { return players_.size(); }
    const Global& global() const { return global_; }

private:
    void HandleEvent(const ServerEvent& event);
    void OnAddPlayer(Fd fd);
    void OnRecvData(Fd fd, const uint8_t* data, size_t len);
    void OnSentData(Fd fd);

    void RunGamePhase();
    void ProcessInbound(Player& player, Compose& compose);
    void Egress();

    GameServerOptions options_;
    ShardPool pool_;
    std::unique_ptr<Server> server_;
    IoBufs bufs_;
    Compressors compressors_;
    Scratches scratches_;
    Broadcast broadcast_;

    absl::flat_hash_map<Fd, std::unique_ptr<Player>> players_;
    size_t next_shard_ = 0;
    Global global_;
};

} // namespace Shardcast

#endif // SHARDCAST_SERVER_GAME_SERVER_H_
