#ifndef STREAMER_MSG_MANIFESTOPTION_HPP
#define STREAMER_MSG_MANIFESTOPTION_HPP

#include"Json/Out.hpp"
#include"Streamer/Msg/OptionType.hpp"
#include<string>

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::ManifestOption
 *
 * @brief registers a `lightningd` option in the
 * manifest; its value arrives later as
 * Streamer::Msg::Option.
 */
struct ManifestOption {
	std::string name;
	OptionType type;
	Json::Out default_value;
	std::string description;
};

}}

#endif /* !defined(STREAMER_MSG_MANIFESTOPTION_HPP) */
