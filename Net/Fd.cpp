#include"Net/Fd.hpp"
#include<errno.h>
#include<unistd.h>

namespace Net {

void Fd::reset(int fd_) {
	if (fd >= 0 && fd != fd_) {
		/* close() may clobber errno the caller is about to read.  */
		auto saved = errno;
		close(fd);
		errno = saved;
	}
	fd = fd_;
}

}
