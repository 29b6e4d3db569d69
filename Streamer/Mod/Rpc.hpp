#ifndef STREAMER_MOD_RPC_HPP
#define STREAMER_MOD_RPC_HPP

#include"Jsmn/Object.hpp"
#include"Util/BacktraceException.hpp"
#include<memory>
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Json { class Out; }
namespace Net { class Fd; }
namespace S { class Bus; }

namespace Streamer { namespace Mod {

/** struct Streamer::Mod::RpcError
 *
 * @brief lightningd answered a command with a
 * JSON-RPC error.
 */
struct RpcError : public Util::BacktraceException<std::runtime_error> {
	RpcError(std::string command, Jsmn::Object error);

	std::string command;
	Jsmn::Object error;

	/* `error.code`, or 0 if absent.  */
	int code() const;
	/* `error.message`, or the whole error as JSON.  */
	std::string message() const;
};

/** class Streamer::Mod::Rpc
 *
 * @brief JSON-RPC client on the lightningd RPC
 * socket.
 *
 * @desc Constructed by the Initiator during
 * `init`.
 * Several commands may be outstanding at once;
 * replies are matched back by id.
 * On Streamer::Shutdown, and if the socket fails,
 * every outstanding command fails.
 */
class Rpc {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Rpc(S::Bus& bus, Net::Fd socket);
	Rpc(Rpc&&);
	~Rpc();

	Ev::Io<Jsmn::Object> command( std::string const& command
				    , Json::Out params
				    );
};

}}

#endif /* !defined(STREAMER_MOD_RPC_HPP) */
