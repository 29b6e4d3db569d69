#ifndef STREAMER_MOD_STREAMCOMMANDS_HPP
#define STREAMER_MOD_STREAMCOMMANDS_HPP

#include<memory>

namespace S { class Bus; }
namespace Streamer { namespace Mod { class StreamController; }}

namespace Streamer { namespace Mod {

/** class Streamer::Mod::StreamCommands
 *
 * @brief the `streamer-*` plugin commands.
 *
 * @desc Each command takes its parameters either
 * by position or by name, and forwards to the
 * StreamController.
 * Bad parameters fail with -32602; failures of
 * the stream operation itself fail with -1 and
 * the error kind in `data.error`.
 */
class StreamCommands {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	StreamCommands() =delete;
	StreamCommands(StreamCommands&&);
	~StreamCommands();

	StreamCommands(S::Bus& bus, StreamController& controller);
};

}}

#endif /* !defined(STREAMER_MOD_STREAMCOMMANDS_HPP) */
