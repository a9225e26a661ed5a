#ifndef SHARDCAST_CONFIGURATION_H_
#define SHARDCAST_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "config.h"

namespace YAML {
class Node;
}

namespace Shardcast {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct ShardcastConfig {
    struct Server {
        ConfigValue<std::string> address{"0.0.0.0:25565", "SHARDCAST_ADDRESS"};
        ConfigValue<int> tick_ms{50, "SHARDCAST_TICK_MS"};
        // Broadcast a KeepAlive every N ticks (0 disables)
        ConfigValue<int> keepalive_ticks{200, "SHARDCAST_KEEPALIVE_TICKS"};
    } server;

    struct Shards {
        // 0 = one shard per hardware thread
        ConfigValue<int> count{0, "SHARDCAST_SHARDS"};
        ConfigValue<size_t> ring_buffer_size{S2C_BUFFER_SIZE, "SHARDCAST_RING_BUFFER_SIZE"};
    } shards;

    struct Compression {
        // -1 disables compression
        ConfigValue<int> threshold{DEFAULT_COMPRESSION_THRESHOLD, "SHARDCAST_COMPRESSION_THRESHOLD"};
        ConfigValue<int> level{DEFAULT_COMPRESSION_LEVEL, "SHARDCAST_COMPRESSION_LEVEL"};
    } compression;

    struct Network {
        ConfigValue<int> max_events{256, "SHARDCAST_MAX_EVENTS"};
        ConfigValue<bool> zero_copy{true, "SHARDCAST_ZERO_COPY"};
        // Batches smaller than this are sent by copy even when zero_copy is on
        ConfigValue<size_t> zerocopy_min_bytes{1UL << 14, "SHARDCAST_ZEROCOPY_MIN_BYTES"};
        ConfigValue<bool> pin_buffers{false, "SHARDCAST_PIN_BUFFERS"};
        ConfigValue<size_t> recv_buffer_size{1UL << 16, "SHARDCAST_RECV_BUFFER_SIZE"};
    } network;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const ShardcastConfig& config() const { return config_; }
    ShardcastConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getAddress() const { return config_.server.address.get(); }
    size_t getNumShards() const;
    size_t getRingBufferSize() const { return config_.shards.ring_buffer_size.get(); }
    int32_t getCompressionThreshold() const { return config_.compression.threshold.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Restore defaults (tests)
    void reset() { config_ = ShardcastConfig(); }

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    ShardcastConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Shardcast

#endif // SHARDCAST_CONFIGURATION_H_
