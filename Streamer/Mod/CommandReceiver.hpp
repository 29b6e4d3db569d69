#ifndef STREAMER_MOD_COMMANDRECEIVER_HPP
#define STREAMER_MOD_COMMANDRECEIVER_HPP

#include<set>
#include<string>

namespace S { class Bus; }

namespace Streamer { namespace Mod {

/** class Streamer::Mod::CommandReceiver
 *
 * @brief turns JSON-RPC requests on stdin into
 * Streamer::Msg::CommandRequest, and the matching
 * CommandResponse/CommandFail back into JSON-RPC
 * replies.
 *
 * @desc Requests without an `id` are notifications;
 * this plugin subscribes to none, so they are
 * dropped.
 */
class CommandReceiver {
private:
	S::Bus& bus;
	/* JSON text of ids still owed a reply.  */
	std::set<std::string> pending;

	bool take(std::string const& id);

public:
	explicit
	CommandReceiver(S::Bus& bus);
};

}}

#endif /* !defined(STREAMER_MOD_COMMANDRECEIVER_HPP) */
