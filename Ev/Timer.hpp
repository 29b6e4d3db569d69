#ifndef EV_TIMER_HPP
#define EV_TIMER_HPP

#include<functional>
#include<memory>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** class Ev::Timer
 *
 * @brief owns a libev timer that runs an action
 * after `after` seconds, then every `repeat`
 * seconds if `repeat` is nonzero.
 *
 * @desc Destroying or stopping the timer cancels
 * any firing that has not happened yet.
 * It is safe to destroy a timer from inside its
 * own action.
 * The action is started from the timer callback
 * and should hand off long work with
 * Ev::concurrent.
 *
 * A default-constructed timer is inactive.
 */
class Timer {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Timer();
	Timer( double after
	     , double repeat
	     , std::function<Ev::Io<void>()> action
	     );
	Timer(Timer&&);
	Timer& operator=(Timer&&);
	~Timer();

	void stop();
	bool active() const;
};

}

#endif /* !defined(EV_TIMER_HPP) */
