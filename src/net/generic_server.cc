#include "generic_server.h"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>

#include <glog/logging.h>

#include "socket_utils.h"

namespace Shardcast {

namespace {

constexpr size_t kMaxIovPerSend = 64;

} // namespace

GenericServer::GenericServer(const std::string& address, const ServerOptions& options)
	: options_(options),
	  listener_(CreateListener(address)) {
	recv_buf_.resize(options_.recv_buffer_size);
	if (options_.zero_copy) {
		VLOG(1) << "GenericServer: zero_copy requested but unsupported, sending by copy";
	}
	LOG(INFO) << "GenericServer ready";
}

uint16_t GenericServer::Port() const {
	return LocalPort(listener_.get());
}

void GenericServer::AllocateBuffers(const std::vector<struct iovec>& buffers) {
	CHECK(registered_.empty()) << "AllocateBuffers called twice";
	registered_ = buffers;
	VLOG(1) << "GenericServer: " << registered_.size() << " buffers registered";
}

void GenericServer::Emit(const ServerEvent& event) {
	if (current_ != nullptr) {
		(*current_)(event);
	} else {
		deferred_.push_back(event);
	}
}

bool GenericServer::Drain(const EventCallback& f) {
	current_ = &f;
	while (!deferred_.empty()) {
		f(deferred_.front());
		deferred_.pop_front();
	}

	std::vector<struct pollfd> fds;
	std::vector<int64_t> ids;
	fds.reserve(connections_.size() + 1);
	ids.reserve(connections_.size());

	fds.push_back({listener_.get(), POLLIN, 0});
	for (const auto& [id, conn] : connections_) {
		short events = conn->read_closed ? 0 : POLLIN;
		if (conn->want_write) events |= POLLOUT;
		fds.push_back({conn->sock.get(), events, 0});
		ids.push_back(id);
	}

	int n = poll(fds.data(), fds.size(), 0);
	if (n < 0) {
		current_ = nullptr;
		if (errno == EINTR) return true;
		LOG(ERROR) << "poll failed: " << strerror(errno);
		return false;
	}

	for (size_t i = 1; i < fds.size() && n > 0; ++i) {
		const short revents = fds[i].revents;
		if (revents == 0) continue;
		n--;

		const int64_t id = ids[i - 1];
		auto it = connections_.find(id);
		if (it == connections_.end()) continue;
		Connection& conn = *it->second;

		if (revents & (POLLERR | POLLNVAL)) {
			CloseConnection(id);
			continue;
		}
		if (conn.read_closed) {
			// Half-closed peer that also dropped its read side
			if (revents & POLLHUP) {
				CloseConnection(id);
				continue;
			}
		} else if ((revents & (POLLIN | POLLHUP)) && !ReadFromConnection(id, conn, f)) {
			continue;
		}
		if ((revents & POLLOUT) && !FlushConnection(id, conn)) {
			CloseConnection(id);
			continue;
		}
		CloseIfFinished(id, conn);
	}

	// New connections last so their AddPlayer never precedes a removal
	if (fds[0].revents & POLLIN) {
		AcceptConnections(f);
	}

	current_ = nullptr;
	return true;
}

void GenericServer::AcceptConnections(const EventCallback& f) {
	while (true) {
		int fd = accept(listener_.get(), nullptr, nullptr);
		if (fd < 0) {
			if (errno == EAGAIN || errno == EWOULDBLOCK) break;
			if (errno == EINTR || errno == ECONNABORTED) continue;
			LOG(ERROR) << "Error accepting connection: " << strerror(errno);
			break;
		}

		auto conn = std::make_unique<Connection>();
		conn->sock = ScopedFd(fd);
		if (!ConfigureNonBlockingSocket(fd)) continue;
		DisableNagle(fd);

		const int64_t id = next_id_++;
		connections_.emplace(id, std::move(conn));
		VLOG(1) << "Accepted connection id=" << id << " fd=" << fd;
		f(AddPlayer{Fd(id)});
	}
}

bool GenericServer::ReadFromConnection(int64_t id, Connection& conn, const EventCallback& f) {
	while (true) {
		ssize_t r = recv(conn.sock.get(), recv_buf_.data(), recv_buf_.size(), 0);
		if (r > 0) {
			f(RecvData{Fd(id), recv_buf_.data(), static_cast<size_t>(r)});
			if (static_cast<size_t>(r) < recv_buf_.size()) return true;
			continue;
		}
		if (r == 0) {
			if (conn.queue.Empty()) {
				VLOG(1) << "Peer closed id=" << id;
				CloseConnection(id);
				return false;
			}
			VLOG(1) << "Peer half-closed id=" << id << ", flushing " << conn.queue.Size()
				<< " regions before closing";
			conn.read_closed = true;
			return true;
		}
		if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
		if (errno == EINTR) continue;
		VLOG(1) << "recv failed on id=" << id << ": " << strerror(errno);
		CloseConnection(id);
		return false;
	}
}

bool GenericServer::FlushConnection(int64_t id, Connection& conn) {
	struct iovec iov[kMaxIovPerSend];

	while (!conn.queue.Empty()) {
		size_t batch_bytes = 0;
		size_t iov_count = conn.queue.BuildIov(iov, kMaxIovPerSend, &batch_bytes);

		size_t sent = 0;
		if (batch_bytes > 0) {
			struct msghdr msg;
			std::memset(&msg, 0, sizeof(msg));
			msg.msg_iov = iov;
			msg.msg_iovlen = iov_count;

			ssize_t ret = sendmsg(conn.sock.get(), &msg, MSG_NOSIGNAL);
			if (ret < 0) {
				if (errno == EINTR) continue;
				if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS) {
					conn.want_write = true;
					return true;
				}
				LOG(ERROR) << "Error sending data on id=" << id << ": " << strerror(errno);
				return false;
			}
			sent = static_cast<size_t>(ret);
		}

		size_t completed = conn.queue.Consume(sent);
		for (size_t i = 0; i < completed; ++i) Emit(SentData{Fd(id)});

		if (sent < batch_bytes) {
			conn.want_write = true;
			return true;
		}
	}

	conn.want_write = false;
	return true;
}

void GenericServer::CloseIfFinished(int64_t id, const Connection& conn) {
	if (conn.read_closed && conn.queue.Empty()) {
		CloseConnection(id);
	}
}

void GenericServer::CloseConnection(int64_t id) {
	auto it = connections_.find(id);
	if (it == connections_.end()) return;
	if (!it->second->queue.Empty()) {
		VLOG(1) << "Closing id=" << id << " with " << it->second->queue.Size() << " unsent regions";
	}
	connections_.erase(it);
	Emit(RemovePlayer{Fd(id)});
}

void GenericServer::WriteAll(Global& global, const std::vector<RefreshItems>& writers) {
	for (const RefreshItems& item : writers) {
		const int64_t id = item.fd.value();
		auto it = connections_.find(id);
		if (it == connections_.end()) {
			VLOG(2) << "WriteAll: id=" << id << " already closed";
			continue;
		}
		Connection& conn = *it->second;

		item.write->ForEach([&](const std::deque<PacketWriteInfo>& queue) {
			for (const PacketWriteInfo& info : queue) {
				conn.queue.Push(info);
				global.writes_queued++;
				global.bytes_queued += info.len;
			}
		});

		if (!conn.dirty) {
			conn.dirty = true;
			dirty_.push_back(id);
		}
	}
}

void GenericServer::SubmitEvents() {
	for (int64_t id : dirty_) {
		auto it = connections_.find(id);
		if (it == connections_.end()) continue;
		Connection& conn = *it->second;
		conn.dirty = false;
		if (conn.want_write) continue;
		if (!FlushConnection(id, conn)) {
			CloseConnection(id);
			continue;
		}
		CloseIfFinished(id, conn);
	}
	dirty_.clear();
}

} // namespace Shardcast
