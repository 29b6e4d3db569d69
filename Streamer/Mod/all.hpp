#ifndef STREAMER_MOD_ALL_HPP
#define STREAMER_MOD_ALL_HPP

#include<functional>
#include<memory>
#include<ostream>
#include<string>

namespace Ev { class ThreadPool; }
namespace Net { class Fd; }
namespace S { class Bus; }

namespace Streamer { namespace Mod {

/** Streamer::Mod::all
 *
 * @brief installs every module on the bus.
 * The modules live as long as the returned
 * pointer.
 */
std::shared_ptr<void>
all( std::ostream& cout
   , S::Bus& bus
   , Ev::ThreadPool& threadpool
   , std::function< Net::Fd( std::string const&
			   , std::string const&
			   )
		  > open_rpc_socket
   );

}}

#endif /* !defined(STREAMER_MOD_ALL_HPP) */
