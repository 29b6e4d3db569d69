#ifndef STREAMER_MSG_COMMANDFAIL_HPP
#define STREAMER_MSG_COMMANDFAIL_HPP

#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include<string>

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::CommandFail
 *
 * @brief failed result of a CommandRequest.
 * Same delivery rules as CommandResponse.
 */
struct CommandFail {
	Jsmn::Object id;
	int code;
	std::string message;
	Json::Out data;
};

}}

#endif /* !defined(STREAMER_MSG_COMMANDFAIL_HPP) */
