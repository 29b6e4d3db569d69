#ifndef STREAMER_MOD_ITERATIONSCHEDULER_HPP
#define STREAMER_MOD_ITERATIONSCHEDULER_HPP

#include<cstdint>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Streamer { namespace Mod { class StreamController; }}

namespace Streamer { namespace Mod {

/** class Streamer::Mod::IterationScheduler
 *
 * @brief pays one part of a streaming payment
 * every `delay` milliseconds.
 *
 * @desc Each tick requests an invoice from the
 * counterparty and pays it, under a watchdog that
 * fails the stream if the remote side takes
 * longer than the controller's error timeout.
 * Every failure goes to
 * `StreamController::handle_error`, which stops
 * the ticks.
 *
 * Owned by the StreamController.
 */
class IterationScheduler {
private:
	S::Bus& bus;
	StreamController& controller;

	Ev::Io<void> pay( std::string const& id
			, std::uint64_t epoch
			, std::uint64_t watchdog
			, std::string const& invoice
			);

public:
	IterationScheduler(S::Bus& bus, StreamController& controller);

	/* Starts the recurring tick of a registered
	 * stream, replacing any previous one.  */
	void schedule(std::string const& id);
	/* One iteration, as run by the timer.  */
	Ev::Io<void> tick(std::string const& id);
};

}}

#endif /* !defined(STREAMER_MOD_ITERATIONSCHEDULER_HPP) */
