#include "event_loop.h"

#include <cstdio>

#include <glog/logging.h>

#ifdef __linux__
#include "linux_server.h"
#else
#include "generic_server.h"
#endif

namespace Shardcast {

namespace {

std::string HumanBytes(size_t bytes) {
	static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
	double value = static_cast<double>(bytes);
	size_t unit = 0;
	while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
		value /= 1024.0;
		unit++;
	}
	char out[32];
	snprintf(out, sizeof(out), "%.1f %s", value, kUnits[unit]);
	return out;
}

} // namespace

Server::Server(const std::string& address, const ServerOptions& options)
	: impl_(std::make_unique<PlatformServer>(address, options)) {
	LOG(INFO) << "Listening on " << address << " (port " << impl_->Port() << ")";
}

Server::~Server() = default;

bool Server::Drain(const EventCallback& f) {
	return impl_->Drain(f);
}

void Server::AllocateBuffers(const std::vector<struct iovec>& buffers) {
	size_t total = 0;
	for (size_t i = 0; i < buffers.size(); ++i) {
		VLOG(1) << "buffer " << i << ": " << buffers[i].iov_base << " " << HumanBytes(buffers[i].iov_len);
		total += buffers[i].iov_len;
	}
	LOG(INFO) << "Registering " << buffers.size() << " send buffers, " << HumanBytes(total) << " total";
	impl_->AllocateBuffers(buffers);
}

void Server::WriteAll(Global& global, const std::vector<RefreshItems>& writers) {
	impl_->WriteAll(global, writers);
}

void Server::SubmitEvents() {
	impl_->SubmitEvents();
}

uint16_t Server::Port() const {
	return impl_->Port();
}

size_t Server::NumConnections() const {
	return impl_->NumConnections();
}

} // namespace Shardcast
