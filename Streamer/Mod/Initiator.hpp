#ifndef STREAMER_MOD_INITIATOR_HPP
#define STREAMER_MOD_INITIATOR_HPP

#include<functional>
#include<memory>
#include<string>

namespace Ev { class ThreadPool; }
namespace Net { class Fd; }
namespace S { class Bus; }

namespace Streamer { namespace Mod {

/** class Streamer::Mod::Initiator
 *
 * @brief handles the `init` command.
 *
 * @desc Delivers registered option values, connects
 * to the lightningd RPC socket, opens the plugin
 * database, then raises Streamer::Msg::DbResource
 * and Streamer::Msg::Init before answering.
 * If any of that fails the plugin asks lightningd
 * to disable it.
 */
class Initiator {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Initiator( S::Bus& bus
		 , Ev::ThreadPool& threadpool
		 , std::function<Net::Fd( std::string const&
					, std::string const&
					)> open_rpc_socket
		 );
	Initiator(Initiator&&);
	~Initiator();
};

}}

#endif /* !defined(STREAMER_MOD_INITIATOR_HPP) */
