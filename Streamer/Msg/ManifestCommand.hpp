#ifndef STREAMER_MSG_MANIFESTCOMMAND_HPP
#define STREAMER_MSG_MANIFESTCOMMAND_HPP

#include<string>

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::ManifestCommand
 *
 * @brief registers an RPC command in the manifest.
 */
struct ManifestCommand {
	std::string name;
	std::string usage;
	std::string description;
	bool deprecated;
};

}}

#endif /* !defined(STREAMER_MSG_MANIFESTCOMMAND_HPP) */
