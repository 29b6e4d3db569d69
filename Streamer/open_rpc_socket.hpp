#ifndef STREAMER_OPEN_RPC_SOCKET_HPP
#define STREAMER_OPEN_RPC_SOCKET_HPP

#include<string>

namespace Net { class Fd; }

namespace Streamer {

/** Streamer::open_rpc_socket
 *
 * @brief changes to `lightning_dir` and connects
 * to the unix socket `rpc_file` there.
 *
 * @desc Blocking; call it on the thread pool.
 * Passed to Streamer::Main as a function so tests
 * can substitute a socketpair.
 */
Net::Fd open_rpc_socket( std::string const& lightning_dir
		       , std::string const& rpc_file
		       );

}

#endif /* !defined(STREAMER_OPEN_RPC_SOCKET_HPP) */
