#ifndef SHARDCAST_NET_SERVER_H_
#define SHARDCAST_NET_SERVER_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <sys/uio.h>

#include "common/global.h"
#include "common/shard_local.h"
#include "encoder.h"

namespace Shardcast {

/**
 * Connection identity handed out by the event loop. Only equality and hashing
 * are meaningful; the numeric value is backend specific.
 */
class Fd {
public:
    Fd() = default;
    explicit Fd(int64_t value) : value_(value) {}

    int64_t value() const { return value_; }

    bool operator==(const Fd& o) const { return value_ == o.value_; }
    bool operator!=(const Fd& o) const { return value_ != o.value_; }

    template<typename H>
    friend H AbslHashValue(H h, const Fd& fd) {
        return H::combine(std::move(h), fd.value_);
    }

private:
    int64_t value_ = -1;
};

/*
 * Everything the event loop can report from Drain().
 */
struct AddPlayer {
    Fd fd;
};

struct RemovePlayer {
    Fd fd;
};

// data is only valid for the duration of the callback
struct RecvData {
    Fd fd;
    const uint8_t* data;
    size_t len;
};

// One PacketWriteInfo handed to WriteAll() for fd has been fully sent
struct SentData {
    Fd fd;
};

using ServerEvent = std::variant<AddPlayer, RemovePlayer, RecvData, SentData>;

/**
 * One queue to flush to one connection.
 */
struct RefreshItems {
    ShardLocal<std::deque<PacketWriteInfo>>* write;
    Fd fd;
};

/**
 * Knobs shared by the backends; a backend ignores what it cannot do.
 */
struct ServerOptions {
    int max_events = 256;
    bool zero_copy = true;
    size_t zerocopy_min_bytes = 1UL << 14;
    bool pin_buffers = false;
    size_t recv_buffer_size = 1UL << 16;
};

/**
 * The event loop contract. Backends bind in their constructor and throw
 * std::system_error when the address cannot be bound.
 */
class ServerDef {
public:
    using EventCallback = std::function<void(const ServerEvent&)>;

    virtual ~ServerDef() = default;

    /**
     * Report every event that is ready right now; never waits for new ones.
     * Events of one connection are reported in the order they happened.
     * @return false if the poller itself failed
     */
    virtual bool Drain(const EventCallback& f) = 0;

    /**
     * Register the shard rings. Called once at startup, before WriteAll().
     * A failure here is fatal.
     */
    virtual void AllocateBuffers(const std::vector<struct iovec>& buffers) = 0;

    /**
     * Queue every item's regions on its connection, in item order. Pass each
     * connection's own item before any broadcast item so that its own packets go
     * out first. The caller owns completion accounting (one SentData per region).
     */
    virtual void WriteAll(Global& global, const std::vector<RefreshItems>& writers) = 0;

    /// Hand everything queued by WriteAll() to the kernel.
    virtual void SubmitEvents() = 0;
};

} // namespace Shardcast

namespace std {
template<>
struct hash<Shardcast::Fd> {
    size_t operator()(const Shardcast::Fd& fd) const { return std::hash<int64_t>()(fd.value()); }
};
} // namespace std

#endif // SHARDCAST_NET_SERVER_H_
