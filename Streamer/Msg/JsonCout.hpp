#ifndef STREAMER_MSG_JSONCOUT_HPP
#define STREAMER_MSG_JSONCOUT_HPP

#include"Json/Out.hpp"

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::JsonCout
 *
 * @brief raise to write a JSON datum to stdout.
 */
struct JsonCout {
	Json::Out obj;
};

}}

#endif /* !defined(STREAMER_MSG_JSONCOUT_HPP) */
