#include "socket_utils.h"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <fcntl.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <glog/logging.h>

namespace Shardcast {

namespace {

void SplitHostPort(const std::string& address, std::string* host, std::string* port) {
	size_t colon = address.rfind(':');
	if (colon == std::string::npos) {
		throw std::system_error(EINVAL, std::generic_category(),
				"Invalid address '" + address + "', expected host:port");
	}
	*host = address.substr(0, colon);
	*port = address.substr(colon + 1);
	// [::1]:25565
	if (host->size() >= 2 && host->front() == '[' && host->back() == ']') {
		*host = host->substr(1, host->size() - 2);
	}
}

} // namespace

bool ConfigureNonBlockingSocket(int fd) {
	int flags = fcntl(fd, F_GETFL, 0);
	if (flags == -1) {
		LOG(ERROR) << "fcntl F_GETFL failed: " << strerror(errno);
		return false;
	}

	flags |= O_NONBLOCK;
	if (fcntl(fd, F_SETFL, flags) == -1) {
		LOG(ERROR) << "fcntl F_SETFL failed: " << strerror(errno);
		return false;
	}
	return true;
}

bool DisableNagle(int fd) {
	int flag = 1;
	if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) != 0) {
		LOG(ERROR) << "setsockopt(TCP_NODELAY) failed: " << strerror(errno);
		return false;
	}
	return true;
}

ScopedFd CreateListener(const std::string& address) {
	std::string host, port;
	SplitHostPort(address, &host, &port);

	struct addrinfo hints;
	std::memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_flags = AI_PASSIVE;

	struct addrinfo* result = nullptr;
	int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &result);
	if (rc != 0) {
		throw std::system_error(EINVAL, std::generic_category(),
				"Cannot resolve '" + address + "': " + gai_strerror(rc));
	}

	int last_errno = 0;
	ScopedFd listener;
	for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
		ScopedFd sock(socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
		if (!sock.valid()) {
			last_errno = errno;
			continue;
		}

		int flag = 1;
		if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag)) < 0) {
			LOG(WARNING) << "setsockopt(SO_REUSEADDR) failed: " << strerror(errno);
		}

		if (bind(sock.get(), ai->ai_addr, ai->ai_addrlen) == 0 &&
				listen(sock.get(), SOMAXCONN) == 0 &&
				ConfigureNonBlockingSocket(sock.get())) {
			listener = std::move(sock);
			break;
		}
		last_errno = errno;
	}
	freeaddrinfo(result);

	if (!listener.valid()) {
		throw std::system_error(last_errno, std::generic_category(), "Cannot bind " + address);
	}

	LOG(INFO) << "Listening on " << address << " (port " << LocalPort(listener.get()) << ")";
	return listener;
}

uint16_t LocalPort(int fd) {
	struct sockaddr_storage addr;
	socklen_t len = sizeof(addr);
	if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
		LOG(ERROR) << "getsockname failed: " << strerror(errno);
		return 0;
	}
	if (addr.ss_family == AF_INET) {
		return ntohs(reinterpret_cast<struct sockaddr_in*>(&addr)->sin_port);
	}
	if (addr.ss_family == AF_INET6) {
		return ntohs(reinterpret_cast<struct sockaddr_in6*>(&addr)->sin6_port);
	}
	return 0;
}

} // namespace Shardcast
