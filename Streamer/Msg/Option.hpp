#ifndef STREAMER_MSG_OPTION_HPP
#define STREAMER_MSG_OPTION_HPP

#include"Jsmn/Object.hpp"
#include<string>

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::Option
 *
 * @brief value of a registered option, raised
 * during `init`.
 */
struct Option {
	std::string name;
	Jsmn::Object value;
};

}}

#endif /* !defined(STREAMER_MSG_OPTION_HPP) */
