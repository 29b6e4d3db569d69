#include"Ev/Io.hpp"
#include"Ev/Timer.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<iostream>

namespace Ev {

class Timer::Impl {
private:
	ev_timer timer;
	std::function<Ev::Io<void>()> action;

	static
	void on_timer(EV_P_ ev_timer* w, int) {
		auto self = (Impl*) w->data;
		/* The action may destroy this object, so
		 * nothing below may touch self.  */
		auto act = self->action;
		Ev::lift().then(act).run([]() { }, [](std::exception_ptr e) {
			try {
				std::rethrow_exception(e);
			} catch (std::exception const& err) {
				std::cerr << "Ev::Timer: action failed: "
					  << err.what() << std::endl;
			} catch (...) {
				std::cerr << "Ev::Timer: action failed."
					  << std::endl;
			}
		});
	}

public:
	Impl( double after
	    , double repeat
	    , std::function<Ev::Io<void>()> action_
	    ) : action(std::move(action_)) {
		ev_timer_init(&timer, &on_timer, after, repeat);
		timer.data = this;
		ev_timer_start(EV_DEFAULT_ &timer);
	}
	~Impl() {
		ev_timer_stop(EV_DEFAULT_ &timer);
	}

	bool active() const {
		return ev_is_active(&timer);
	}
};

Timer::Timer() { }
Timer::Timer( double after
	    , double repeat
	    , std::function<Ev::Io<void>()> action
	    ) : pimpl(Util::make_unique<Impl>(after, repeat, std::move(action)))
	      { }
Timer::Timer(Timer&& o) : pimpl(std::move(o.pimpl)) { }
Timer& Timer::operator=(Timer&& o) {
	auto tmp = std::move(o);
	std::swap(pimpl, tmp.pimpl);
	return *this;
}
Timer::~Timer() { }

void Timer::stop() {
	pimpl = nullptr;
}
bool Timer::active() const {
	return pimpl && pimpl->active();
}

}
