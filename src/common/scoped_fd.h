// RAII owner for sockets and epoll descriptors.
#ifndef SHARDCAST_COMMON_SCOPED_FD_H_
#define SHARDCAST_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace Shardcast {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	~ScopedFd() { reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			reset();
			fd = o.fd;
			o.fd = -1;
		}
		return *this;
	}

	int get() const { return fd; }
	bool valid() const { return fd >= 0; }

	void reset() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}
};

} // namespace Shardcast

#endif  // SHARDCAST_COMMON_SCOPED_FD_H_
