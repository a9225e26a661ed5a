#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <thread>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Shardcast {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
	const char* env_val = std::getenv(env_var_.c_str());
	if (env_val) {
		try {
			return std::stoi(env_val);
		} catch (const std::exception& e) {
			LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
		}
	}
	return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
	const char* env_val = std::getenv(env_var_.c_str());
	if (env_val) {
		try {
			return std::stoull(env_val);
		} catch (const std::exception& e) {
			LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
		}
	}
	return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
	const char* env_val = std::getenv(env_var_.c_str());
	if (env_val) {
		return std::string(env_val);
	}
	return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
	const char* env_val = std::getenv(env_var_.c_str());
	if (env_val) {
		std::string val(env_val);
		std::transform(val.begin(), val.end(), val.begin(),
			[](unsigned char c) { return static_cast<char>(std::tolower(c)); });
		if (val == "true" || val == "1" || val == "yes" || val == "on") {
			return true;
		} else if (val == "false" || val == "0" || val == "no" || val == "off") {
			return false;
		}
		LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
	}
	return std::nullopt;
}

Configuration& Configuration::getInstance() {
	static Configuration instance;
	return instance;
}

size_t Configuration::getNumShards() const {
	int count = config_.shards.count.get();
	if (count > 0) return static_cast<size_t>(count);
	unsigned hw = std::thread::hardware_concurrency();
	return hw == 0 ? 1 : hw;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
	if (!yaml["shardcast"]) {
		LOG(WARNING) << "Configuration has no top-level 'shardcast' section";
		return;
	}
	auto root = yaml["shardcast"];

	if (root["server"]) {
		auto server = root["server"];
		if (server["address"]) config_.server.address.set(server["address"].as<std::string>());
		if (server["tick_ms"]) config_.server.tick_ms.set(server["tick_ms"].as<int>());
		if (server["keepalive_ticks"]) config_.server.keepalive_ticks.set(server["keepalive_ticks"].as<int>());
	}

	if (root["shards"]) {
		auto shards = root["shards"];
		if (shards["count"]) config_.shards.count.set(shards["count"].as<int>());
		if (shards["ring_buffer_size"]) config_.shards.ring_buffer_size.set(shards["ring_buffer_size"].as<size_t>());
	}

	if (root["compression"]) {
		auto compression = root["compression"];
		if (compression["threshold"]) config_.compression.threshold.set(compression["threshold"].as<int>());
		if (compression["level"]) config_.compression.level.set(compression["level"].as<int>());
	}

	if (root["network"]) {
		auto network = root["network"];
		if (network["max_events"]) config_.network.max_events.set(network["max_events"].as<int>());
		if (network["zero_copy"]) config_.network.zero_copy.set(network["zero_copy"].as<bool>());
		if (network["zerocopy_min_bytes"]) config_.network.zerocopy_min_bytes.set(network["zerocopy_min_bytes"].as<size_t>());
		if (network["pin_buffers"]) config_.network.pin_buffers.set(network["pin_buffers"].as<bool>());
		if (network["recv_buffer_size"]) config_.network.recv_buffer_size.set(network["recv_buffer_size"].as<size_t>());
	}
}

bool Configuration::loadFromFile(const std::string& filename) {
	try {
		applyYAML(YAML::LoadFile(filename));
		return validate();
	} catch (const YAML::Exception& e) {
		LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
		return false;
	}
}

bool Configuration::loadFromString(const std::string& yaml_content) {
	try {
		applyYAML(YAML::Load(yaml_content));
		return validate();
	} catch (const YAML::Exception& e) {
		LOG(ERROR) << "Failed to parse configuration string: " << e.what();
		return false;
	}
}

bool Configuration::validate() const {
	validation_errors_.clear();

	if (config_.server.address.get().find(':') == std::string::npos) {
		validation_errors_.push_back("Server address must be host:port");
	}

	if (config_.server.tick_ms.get() < 1) {
		validation_errors_.push_back("Tick interval must be at least 1ms");
	}

	if (config_.shards.count.get() < 0) {
		validation_errors_.push_back("Shard count cannot be negative");
	}

	// A ring must hold at least one maximum-size frame
	if (config_.shards.ring_buffer_size.get() < MAX_PACKET_SIZE) {
		validation_errors_.push_back("Ring buffer size must be at least MAX_PACKET_SIZE");
	}

	if (config_.compression.threshold.get() < -1) {
		validation_errors_.push_back("Compression threshold must be -1 (disabled) or >= 0");
	}

	if (config_.compression.level.get() < 0 || config_.compression.level.get() > 9) {
		validation_errors_.push_back("Compression level must be between 0 and 9");
	}

	if (config_.network.max_events.get() < 1) {
		validation_errors_.push_back("max_events must be at least 1");
	}

	if (config_.network.recv_buffer_size.get() == 0) {
		validation_errors_.push_back("recv_buffer_size cannot be 0");
	}

	for (const auto& error : validation_errors_) {
		LOG(ERROR) << "Invalid configuration: " << error;
	}
	return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
	return validation_errors_;
}

} // namespace Shardcast
