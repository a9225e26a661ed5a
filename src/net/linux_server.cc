#include "linux_server.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <linux/errqueue.h>
#include <netinet/in.h>
#include <sys/mman.h>
#include <sys/socket.h>

#include <glog/logging.h>

#include "socket_utils.h"

namespace Shardcast {

namespace {

constexpr size_t kMaxIovPerSend = 64;

} // namespace

LinuxServer::LinuxServer(const std::string& address, const ServerOptions& options)
	: options_(options),
	  listener_(CreateListener(address)),
	  epoll_fd_(epoll_create1(EPOLL_CLOEXEC)) {
	if (!epoll_fd_.valid()) {
		throw std::system_error(errno, std::generic_category(), "epoll_create1");
	}

	struct epoll_event event;
	std::memset(&event, 0, sizeof(event));
	event.events = EPOLLIN;
	event.data.fd = listener_.get();
	if (epoll_ctl(epoll_fd_.get(), EPOLL_CTL_ADD, listener_.get(), &event) == -1) {
		throw std::system_error(errno, std::generic_category(), "epoll_ctl(listener)");
	}

	events_.resize(static_cast<size_t>(std::max(options_.max_events, 1)));
	recv_buf_.resize(options_.recv_buffer_size);

	LOG(INFO) << "LinuxServer ready: zero_copy=" << options_.zero_copy
		<< " zerocopy_min_bytes=" << options_.zerocopy_min_bytes
		<< " pin_buffers=" << options_.pin_buffers;
}

LinuxServer::~LinuxServer() {
	if (pinned_) {
		for (const auto& iov : registered_) {
			munlock(iov.iov_base, iov.iov_len);
		}
	}
	if (zerocopy_copied_ > 0) {
		LOG(INFO) << "LinuxServer: " << zerocopy_copied_ << " zero-copy sends fell back to copying";
	}
}

uint16_t LinuxServer::Port() const {
	return LocalPort(listener_.get());
}

void LinuxServer::AllocateBuffers(const std::vector<struct iovec>& buffers) {
	CHECK(registered_.empty()) << "AllocateBuffers called twice";
	registered_ = buffers;

	if (!options_.pin_buffers) return;

	for (size_t i = 0; i < registered_.size(); ++i) {
		if (mlock(registered_[i].iov_base, registered_[i].iov_len) != 0) {
			LOG(FATAL) << "Failed to pin buffer " << i << " (" << registered_[i].iov_len
				<< " bytes): " << strerror(errno) << ". Raise RLIMIT_MEMLOCK or disable pin_buffers";
		}
	}
	pinned_ = true;
	VLOG(1) << "Pinned " << registered_.size() << " buffers";
}

bool LinuxServer::IsRegistered(const PacketWriteInfo& info) const {
	if (registered_.empty()) return true;
	const uint8_t* start = info.start_ptr;
	for (const auto& iov : registered_) {
		const uint8_t* base = static_cast<const uint8_t*>(iov.iov_base);
		if (start >= base && start + info.len <= base + iov.iov_len) return true;
	}
	return false;
}

void LinuxServer::Emit(const ServerEvent& event) {
	if (current_ != nullptr) {
		(*current_)(event);
	} else {
		deferred_.push_back(event);
	}
}

bool LinuxServer::Drain(const EventCallback& f) {
	current_ = &f;
	while (!deferred_.empty()) {
		f(deferred_.front());
		deferred_.pop_front();
	}

	int n = epoll_wait(epoll_fd_.get(), events_.data(), static_cast<int>(events_.size()), 0);
	if (n < 0) {
		current_ = nullptr;
		if (errno == EINTR) return true;
		LOG(ERROR) << "epoll_wait failed: " << strerror(errno);
		return false;
	}

	for (int i = 0; i < n; ++i) {
		const int fd = events_[i].data.fd;
		const uint32_t ev = events_[i].events;

		if (fd == listener_.get()) {
			AcceptConnections(f);
			continue;
		}

		auto it = connections_.find(fd);
		if (it == connections_.end()) continue;  // closed earlier in this batch
		Connection& conn = *it->second;

		// Zero-copy notifications arrive on the error queue
		if ((ev & EPOLLERR) && !ReapErrorQueue(fd, conn)) {
			CloseConnection(fd);
			continue;
		}

		// EPOLLRDHUP is only a half close; the read loop sees the EOF
		if ((ev & (EPOLLIN | EPOLLRDHUP)) && !conn.read_closed && !ReadFromConnection(fd, f)) {
			continue;
		}

		if (ev & EPOLLHUP) {
			CloseConnection(fd);
			continue;
		}

		if ((ev & EPOLLOUT) && !FlushConnection(fd, conn)) {
			CloseConnection(fd);
			continue;
		}
		CloseIfFinished(fd, conn);
	}

	current_ = nullptr;
	return true;
}

void LinuxServer::AcceptConnections(const EventCallback& f) {
	while (true) {
		int fd = accept4(listener_.get(), nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
		if (fd < 0) {
			if (errno == EAGAIN || errno == EWOULDBLOCK) break;
			if (errno == EINTR || errno == ECONNABORTED) continue;
			LOG(ERROR) << "Error accepting connection: " << strerror(errno);
			break;
		}

		auto conn = std::make_unique<Connection>();
		conn->sock = ScopedFd(fd);
		DisableNagle(fd);

		if (options_.zero_copy) {
			int one = 1;
			if (setsockopt(fd, SOL_SOCKET, SO_ZEROCOPY, &one, sizeof(one)) == 0) {
				conn->zerocopy = true;
			} else {
				VLOG(1) << "setsockopt(SO_ZEROCOPY) failed on fd " << fd << ": " << strerror(errno)
					<< ", sending by copy";
			}
		}

		struct epoll_event event;
		std::memset(&event, 0, sizeof(event));
		event.events = EPOLLIN | EPOLLRDHUP;
		event.data.fd = fd;
		if (epoll_ctl(epoll_fd_.get(), EPOLL_CTL_ADD, fd, &event) == -1) {
			LOG(ERROR) << "epoll_ctl(ADD) failed for fd " << fd << ": " << strerror(errno);
			continue;
		}
		conn->interest = event.events;

		connections_.emplace(fd, std::move(conn));
		VLOG(1) << "Accepted connection fd=" << fd;
		f(AddPlayer{Fd(fd)});
	}
}

bool LinuxServer::ReadFromConnection(int fd, const EventCallback& f) {
	while (true) {
		ssize_t r = recv(fd, recv_buf_.data(), recv_buf_.size(), 0);
		if (r > 0) {
			f(RecvData{Fd(fd), recv_buf_.data(), static_cast<size_t>(r)});
			if (static_cast<size_t>(r) < recv_buf_.size()) return true;
			continue;
		}
		if (r == 0) {
			auto it = connections_.find(fd);
			Connection& conn = *it->second;
			if (conn.queue.Empty() && conn.zc_inflight.empty()) {
				VLOG(1) << "Peer closed fd=" << fd;
				CloseConnection(fd);
				return false;
			}
			ShutdownRead(fd, conn);
			return true;
		}
		if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
		if (errno == EINTR) continue;
		VLOG(1) << "recv failed on fd=" << fd << ": " << strerror(errno);
		CloseConnection(fd);
		return false;
	}
}

bool LinuxServer::ReapErrorQueue(int fd, Connection& conn) {
	while (true) {
		char control[128];
		struct msghdr msg;
		std::memset(&msg, 0, sizeof(msg));
		msg.msg_control = control;
		msg.msg_controllen = sizeof(control);

		ssize_t r = recvmsg(fd, &msg, MSG_ERRQUEUE);
		if (r < 0) {
			if (errno == EAGAIN || errno == EWOULDBLOCK) break;
			if (errno == EINTR) continue;
			LOG(ERROR) << "recvmsg(MSG_ERRQUEUE) failed on fd=" << fd << ": " << strerror(errno);
			return false;
		}

		for (struct cmsghdr* cm = CMSG_FIRSTHDR(&msg); cm != nullptr; cm = CMSG_NXTHDR(&msg, cm)) {
			bool is_recverr = (cm->cmsg_level == SOL_IP && cm->cmsg_type == IP_RECVERR) ||
				(cm->cmsg_level == SOL_IPV6 && cm->cmsg_type == IPV6_RECVERR);
			if (!is_recverr) continue;

			const auto* serr = reinterpret_cast<const struct sock_extended_err*>(CMSG_DATA(cm));
			if (serr->ee_errno != 0) {
				VLOG(1) << "Socket error on fd=" << fd << ": " << strerror(static_cast<int>(serr->ee_errno));
				return false;
			}
			if (serr->ee_origin != SO_EE_ORIGIN_ZEROCOPY) continue;

			const uint32_t lo = serr->ee_info;
			const uint32_t hi = serr->ee_data;
			if (serr->ee_code & SO_EE_CODE_ZEROCOPY_COPIED) {
				zerocopy_copied_ += static_cast<uint64_t>(hi - lo) + 1;
			}
			for (ZeroCopySend& send : conn.zc_inflight) {
				if (static_cast<uint32_t>(send.seq - lo) <= static_cast<uint32_t>(hi - lo)) {
					send.done = true;
				}
			}
		}
	}

	while (!conn.zc_inflight.empty() && conn.zc_inflight.front().done) {
		for (size_t i = 0; i < conn.zc_inflight.front().completed_entries; ++i) {
			Emit(SentData{Fd(fd)});
		}
		conn.zc_inflight.pop_front();
	}

	// EPOLLERR without a queued error still means the socket is broken
	int so_error = 0;
	socklen_t len = sizeof(so_error);
	if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error != 0) {
		VLOG(1) << "SO_ERROR on fd=" << fd << ": " << strerror(so_error);
		return false;
	}
	return true;
}

bool LinuxServer::FlushConnection(int fd, Connection& conn) {
	struct iovec iov[kMaxIovPerSend];

	while (!conn.queue.Empty()) {
		size_t batch_bytes = 0;
		size_t iov_count = conn.queue.BuildIov(iov, kMaxIovPerSend, &batch_bytes);

		if (batch_bytes == 0) {
			// Only empty regions left
			size_t completed = conn.queue.Consume(0);
			for (size_t i = 0; i < completed; ++i) Emit(SentData{Fd(fd)});
			continue;
		}

		const bool use_zerocopy = conn.zerocopy && batch_bytes >= options_.zerocopy_min_bytes;

		struct msghdr msg;
		std::memset(&msg, 0, sizeof(msg));
		msg.msg_iov = iov;
		msg.msg_iovlen = iov_count;

		ssize_t ret = sendmsg(fd, &msg, MSG_NOSIGNAL | (use_zerocopy ? MSG_ZEROCOPY : 0));
		if (ret < 0) {
			if (errno == EINTR) continue;
			if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS) {
				UpdateInterest(fd, conn, true);
				return true;
			}
			LOG(ERROR) << "Error sending data on fd=" << fd << ": " << strerror(errno)
				<< ", to_send: " << batch_bytes;
			return false;
		}

		size_t completed = conn.queue.Consume(static_cast<size_t>(ret));
		if (use_zerocopy) {
			conn.zc_inflight.push_back({conn.next_zc_seq++, completed, false});
		} else {
			for (size_t i = 0; i < completed; ++i) Emit(SentData{Fd(fd)});
		}

		if (static_cast<size_t>(ret) < batch_bytes) {
			// Socket buffer full
			UpdateInterest(fd, conn, true);
			return true;
		}
	}

	UpdateInterest(fd, conn, false);
	return true;
}

void LinuxServer::UpdateInterest(int fd, Connection& conn, bool want_write) {
	uint32_t interest = (conn.read_closed ? 0 : (EPOLLIN | EPOLLRDHUP)) | (want_write ? EPOLLOUT : 0);
	if (conn.interest == interest) return;

	struct epoll_event event;
	std::memset(&event, 0, sizeof(event));
	event.events = interest;
	event.data.fd = fd;
	if (epoll_ctl(epoll_fd_.get(), EPOLL_CTL_MOD, fd, &event) == -1) {
		LOG(ERROR) << "epoll_ctl(MOD) failed for fd " << fd << ": " << strerror(errno);
		return;
	}
	conn.interest = interest;
	conn.want_write = want_write;
}

void LinuxServer::ShutdownRead(int fd, Connection& conn) {
	VLOG(1) << "Peer half-closed fd=" << fd << ", flushing " << conn.queue.Size()
		<< " regions before closing";
	conn.read_closed = true;
	UpdateInterest(fd, conn, conn.want_write);
}

void LinuxServer::CloseIfFinished(int fd, const Connection& conn) {
	if (conn.read_closed && conn.queue.Empty() && conn.zc_inflight.empty()) {
		CloseConnection(fd);
	}
}

void LinuxServer::CloseConnection(int fd) {
	auto it = connections_.find(fd);
	if (it == connections_.end()) return;

	if (!it->second->zc_inflight.empty() || !it->second->queue.Empty()) {
		VLOG(1) << "Closing fd=" << fd << " with " << it->second->queue.Size()
			<< " unsent regions and " << it->second->zc_inflight.size() << " unacknowledged sends";
	}
	epoll_ctl(epoll_fd_.get(), EPOLL_CTL_DEL, fd, nullptr);
	connections_.erase(it);
	Emit(RemovePlayer{Fd(fd)});
}

void LinuxServer::WriteAll(Global& global, const std::vector<RefreshItems>& writers) {
	for (const RefreshItems& item : writers) {
		const int fd = static_cast<int>(item.fd.value());
		auto it = connections_.find(fd);
		if (it == connections_.end()) {
			VLOG(2) << "WriteAll: fd=" << fd << " already closed";
			continue;
		}
		Connection& conn = *it->second;

		item.write->ForEach([&](const std::deque<PacketWriteInfo>& queue) {
			for (const PacketWriteInfo& info : queue) {
				DCHECK(IsRegistered(info)) << "region " << static_cast<const void*>(info.start_ptr)
					<< " is outside every registered buffer";
				conn.queue.Push(info);
				global.writes_queued++;
				global.bytes_queued += info.len;
			}
		});

		if (!conn.dirty) {
			conn.dirty = true;
			dirty_.push_back(fd);
		}
	}
}

void LinuxServer::SubmitEvents() {
	for (int fd : dirty_) {
		auto it = connections_.find(fd);
		if (it == connections_.end()) continue;
		Connection& conn = *it->second;
		conn.dirty = false;

		// Already waiting for EPOLLOUT; Drain() picks it up
		if (conn.want_write) continue;

		if (!FlushConnection(fd, conn)) {
			CloseConnection(fd);
			continue;
		}
		CloseIfFinished(fd, conn);
	}
	dirty_.clear();
}

} // namespace Shardcast
