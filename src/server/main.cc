#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/config.h"
#include "common/configuration.h"
#include "game_server.h"

namespace {

std::atomic<bool> g_stop{false};

void HandleSignal(int) {
	g_stop.store(true);
}

} // namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	// Parse command line arguments
	cxxopts::Options options("Shardcast", "Sharded outbound network core for a Minecraft game server");

	options.add_options()
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("a,address", "Listen address (host:port)", cxxopts::value<std::string>())
		("s,shards", "Number of shards (0 = hardware threads)", cxxopts::value<int>())
		("t,threshold", "Compression threshold in bytes (-1 disables)", cxxopts::value<int>())
		("no_zero_copy", "Send by copy even where MSG_ZEROCOPY is available")
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	Shardcast::Configuration& configuration = Shardcast::Configuration::getInstance();
	if (arguments.count("config")) {
		const std::string path = arguments["config"].as<std::string>();
		if (!configuration.loadFromFile(path)) {
			LOG(ERROR) << "Failed to load configuration from " << path;
			return EXIT_FAILURE;
		}
	}

	Shardcast::ShardcastConfig& config = configuration.config();
	if (arguments.count("address")) {
		config.server.address.set(arguments["address"].as<std::string>());
	}
	if (arguments.count("shards")) {
		config.shards.count.set(arguments["shards"].as<int>());
	}
	if (arguments.count("threshold")) {
		config.compression.threshold.set(arguments["threshold"].as<int>());
	}
	if (arguments.count("no_zero_copy")) {
		config.network.zero_copy.set(false);
	}

	if (!configuration.validate()) {
		return EXIT_FAILURE;
	}

	LOG(INFO) << "Starting Shardcast for " << Shardcast::MINECRAFT_VERSION
		<< " (protocol " << Shardcast::PROTOCOL_VERSION << ")";

	std::signal(SIGINT, HandleSignal);
	std::signal(SIGTERM, HandleSignal);

	// *************** Run **********************
	const auto tick = std::chrono::milliseconds(config.server.tick_ms.get());
	try {
		Shardcast::GameServer server(Shardcast::GameServerOptions::FromConfiguration(configuration));

		auto next = std::chrono::steady_clock::now();
		while (!g_stop.load()) {
			if (!server.Tick()) {
				LOG(ERROR) << "Event loop failed, shutting down";
				return EXIT_FAILURE;
			}
			next += tick;
			auto now = std::chrono::steady_clock::now();
			if (next > now) {
				std::this_thread::sleep_until(next);
			} else {
				VLOG(1) << "Tick overran by "
					<< std::chrono::duration_cast<std::chrono::milliseconds>(now - next).count() << " ms";
				next = now;
			}
		}
	} catch (const std::system_error& e) {
		LOG(ERROR) << "Failed to start server: " << e.what();
		return EXIT_FAILURE;
	}

	LOG(INFO) << "Shutting down";
	return EXIT_SUCCESS;
}
