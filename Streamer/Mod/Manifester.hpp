#ifndef STREAMER_MOD_MANIFESTER_HPP
#define STREAMER_MOD_MANIFESTER_HPP

#include"Streamer/Msg/ManifestCommand.hpp"
#include"Streamer/Msg/ManifestOption.hpp"
#include<map>
#include<set>
#include<string>

namespace S { class Bus; }

namespace Streamer { namespace Mod {

/** class Streamer::Mod::Manifester
 *
 * @brief answers `getmanifest`.
 *
 * @desc Raises Streamer::Msg::Manifestation, collects
 * the Manifest* messages other modules raise in
 * response, and replies with the manifest.
 */
class Manifester {
private:
	S::Bus& bus;

	std::map<std::string, Msg::ManifestCommand> commands;
	std::map<std::string, Msg::ManifestOption> options;
	std::set<std::string> notifications;

	void start();

public:
	explicit
	Manifester(S::Bus& bus_) : bus(bus_) { start(); }
};

}}

#endif /* !defined(STREAMER_MOD_MANIFESTER_HPP) */
