#ifndef NET_FD_HPP
#define NET_FD_HPP

#include<cstddef>

namespace Net {

/** class Net::Fd
 *
 * @brief owns a file descriptor and closes it on
 * destruction.
 * Used for the plugin's stdin/stdout and the
 * lightningd RPC socket.
 */
class Fd {
private:
	int fd;

public:
	Fd(std::nullptr_t = nullptr) : fd(-1) { }
	explicit Fd(int fd_) : fd(fd_) { }
	Fd(Fd const&) =delete;
	Fd(Fd&& o) : fd(o.release()) { }
	Fd& operator=(Fd&& o) {
		reset(o.release());
		return *this;
	}
	~Fd() { reset(); }

	int get() const { return fd; }
	int release() {
		auto ret = fd;
		fd = -1;
		return ret;
	}
	/* Closes the current descriptor, if any.  */
	void reset(int fd_ = -1);

	explicit operator bool() const { return fd >= 0; }
	bool operator!() const { return fd < 0; }
};

}

#endif /* !defined(NET_FD_HPP) */
