#include"Net/Fd.hpp"
#include"Streamer/open_rpc_socket.hpp"
#include"Util/BacktraceException.hpp"
#include<errno.h>
#include<stdexcept>
#include<string.h>
#include<sys/socket.h>
#include<sys/types.h>
#include<sys/un.h>
#include<unistd.h>

namespace {

Util::BacktraceException<std::runtime_error>
sys_error(std::string const& what, int err) {
	return Util::BacktraceException<std::runtime_error>(
		"open_rpc_socket: " + what + ": " + strerror(err)
	);
}

}

namespace Streamer {

Net::Fd open_rpc_socket( std::string const& lightning_dir
		       , std::string const& rpc_file
		       ) {
	if (chdir(lightning_dir.c_str()) < 0)
		throw sys_error("chdir " + lightning_dir, errno);

	auto addr = sockaddr_un();
	if (rpc_file.size() + 1 > sizeof(addr.sun_path))
		throw sys_error(rpc_file, ENAMETOOLONG);
	addr.sun_family = AF_UNIX;
	strncpy(addr.sun_path, rpc_file.c_str(), sizeof(addr.sun_path) - 1);

	auto fd = Net::Fd(socket(AF_UNIX, SOCK_STREAM, 0));
	if (!fd)
		throw sys_error("socket", errno);

	auto res = int();
	do {
		res = connect( fd.get()
			     , reinterpret_cast<sockaddr const*>(&addr)
			     , sizeof(addr)
			     );
	} while (res < 0 && errno == EINTR);
	if (res < 0)
		throw sys_error("connect " + rpc_file, errno);

	return fd;
}

}
