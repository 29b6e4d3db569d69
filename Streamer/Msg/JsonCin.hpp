#ifndef STREAMER_MSG_JSONCIN_HPP
#define STREAMER_MSG_JSONCIN_HPP

#include"Jsmn/Object.hpp"

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::JsonCin
 *
 * @brief one JSON datum read from stdin.
 */
struct JsonCin {
	Jsmn::Object obj;
};

}}

#endif /* !defined(STREAMER_MSG_JSONCIN_HPP) */
