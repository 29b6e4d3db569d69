#ifndef STREAMER_MSG_COMMANDREQUEST_HPP
#define STREAMER_MSG_COMMANDREQUEST_HPP

#include"Jsmn/Object.hpp"
#include<string>

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::CommandRequest
 *
 * @brief raised for each JSON-RPC request from
 * lightningd.
 * Answer with exactly one CommandResponse or
 * CommandFail carrying the same `id`.
 *
 * @desc `id` is kept as the JSON value lightningd
 * sent, which may be a number or a string.
 */
struct CommandRequest {
	std::string command;
	Jsmn::Object params;
	Jsmn::Object id;
};

}}

#endif /* !defined(STREAMER_MSG_COMMANDREQUEST_HPP) */
