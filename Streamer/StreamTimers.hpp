#ifndef STREAMER_STREAMTIMERS_HPP
#define STREAMER_STREAMTIMERS_HPP

#include"Ev/Timer.hpp"
#include<cstdint>
#include<functional>
#include<map>

namespace Ev { template<typename a> class Io; }

namespace Streamer {

/** class Streamer::StreamTimers
 *
 * @brief the timers of one stream: the recurring
 * tick and the watchdogs of ticks in progress.
 *
 * @desc Each watchdog is identified by the key
 * returned when it is armed, so that a tick only
 * ever cancels its own watchdog.
 * `cancel_all` stops everything; it may be called
 * from inside any of the timer actions.
 * Actions refer back to this object, so it is
 * never moved.
 */
class StreamTimers {
private:
	Ev::Timer interval;
	std::map<std::uint64_t, Ev::Timer> watchdogs;
	std::uint64_t next_key;

public:
	StreamTimers() : next_key(0) { }
	StreamTimers(StreamTimers const&) =delete;
	StreamTimers(StreamTimers&&) =delete;

	/* Replaces any existing recurring tick.  */
	void start_interval( double seconds
			   , std::function<Ev::Io<void>()> tick
			   );
	std::uint64_t arm_watchdog( double seconds
				  , std::function<Ev::Io<void>()> fire
				  );
	/* Unknown or already-fired keys are ignored.  */
	void cancel_watchdog(std::uint64_t key);
	void cancel_all();

	bool interval_active() const { return interval.active(); }
	std::size_t watchdog_count() const { return watchdogs.size(); }
	bool active() const {
		return interval_active() || !watchdogs.empty();
	}
};

}

#endif /* !defined(STREAMER_STREAMTIMERS_HPP) */
