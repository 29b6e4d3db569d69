#include"Ev/Io.hpp"
#include"Streamer/StreamTimers.hpp"

namespace Streamer {

void StreamTimers::start_interval( double seconds
				 , std::function<Ev::Io<void>()> tick
				 ) {
	interval = Ev::Timer(seconds, seconds, std::move(tick));
}

std::uint64_t
StreamTimers::arm_watchdog( double seconds
			  , std::function<Ev::Io<void>()> fire
			  ) {
	auto key = next_key++;
	/* A fired watchdog removes itself first.  */
	auto once = [this, key, fire]() -> Ev::Io<void> {
		if (watchdogs.erase(key) == 0)
			return Ev::lift();
		return fire();
	};
	watchdogs.emplace(key, Ev::Timer(seconds, 0, once));
	return key;
}

void StreamTimers::cancel_watchdog(std::uint64_t key) {
	watchdogs.erase(key);
}

void StreamTimers::cancel_all() {
	interval.stop();
	watchdogs.clear();
}

}
