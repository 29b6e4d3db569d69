#ifndef STREAMER_MSG_COMMANDRESPONSE_HPP
#define STREAMER_MSG_COMMANDRESPONSE_HPP

#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::CommandResponse
 *
 * @brief successful result of a CommandRequest.
 * Responses to unknown or already-answered ids
 * are dropped.
 */
struct CommandResponse {
	Jsmn::Object id;
	Json::Out response;
};

}}

#endif /* !defined(STREAMER_MSG_COMMANDRESPONSE_HPP) */
