#include "not_implemented_server.h"

#include <glog/logging.h>

namespace Shardcast {

namespace {

constexpr char kMessage[] = "not implemented; use Linux";

} // namespace

NotImplementedServer::NotImplementedServer(const std::string& address, const ServerOptions&) {
	LOG(FATAL) << kMessage << " (address " << address << ")";
}

bool NotImplementedServer::Drain(const EventCallback&) {
	LOG(FATAL) << kMessage;
	return false;
}

void NotImplementedServer::AllocateBuffers(const std::vector<struct iovec>&) {
	LOG(FATAL) << kMessage;
}

void NotImplementedServer::WriteAll(Global&, const std::vector<RefreshItems>&) {
	LOG(FATAL) << kMessage;
}

void NotImplementedServer::SubmitEvents() {
	LOG(FATAL) << kMessage;
}

} // namespace Shardcast
