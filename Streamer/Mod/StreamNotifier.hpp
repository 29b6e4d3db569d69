#ifndef STREAMER_MOD_STREAMNOTIFIER_HPP
#define STREAMER_MOD_STREAMNOTIFIER_HPP

namespace S { class Bus; }

namespace Streamer { namespace Mod {

/** class Streamer::Mod::StreamNotifier
 *
 * @brief forwards stream progress and stream
 * errors to lightningd as the custom
 * notifications `streamer_progress` and
 * `streamer_error`, and logs them.
 */
class StreamNotifier {
private:
	S::Bus& bus;

	void start();

public:
	StreamNotifier() =delete;
	StreamNotifier(StreamNotifier const&) =delete;

	explicit
	StreamNotifier(S::Bus& bus_) : bus(bus_) { start(); }
};

}}

#endif /* !defined(STREAMER_MOD_STREAMNOTIFIER_HPP) */
