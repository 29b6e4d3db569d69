#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/Timer.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<memory>

namespace {

Ev::Io<void> sleep(double seconds) {
	return Ev::Io<void>([seconds]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)>
				     ) {
		auto timer = std::make_shared<Ev::Timer>();
		*timer = Ev::Timer(seconds, 0, [timer, pass]() {
			timer->stop();
			pass();
			return Ev::lift();
		});
	});
}

}

int main() {
	auto oneshot = 0;
	auto repeats = 0;
	auto cancelled = 0;

	auto t1 = Ev::Timer();
	auto t2 = Ev::Timer();
	auto t3 = Ev::Timer();
	auto t4 = Ev::Timer();

	/* Default timers are inactive.  */
	assert(!t1.active());

	auto code = Ev::start(Ev::lift().then([&]() {
		t1 = Ev::Timer(0.01, 0, [&]() {
			++oneshot;
			return Ev::lift();
		});
		t2 = Ev::Timer(0.01, 0.01, [&]() {
			++repeats;
			/* Stopping itself from inside.  */
			if (repeats == 3)
				t2.stop();
			return Ev::lift();
		});
		t3 = Ev::Timer(0.01, 0, [&]() {
			++cancelled;
			return Ev::lift();
		});
		assert(t1.active());
		assert(t3.active());
		t3.stop();
		assert(!t3.active());

		/* Destroying itself from inside.  */
		t4 = Ev::Timer(0.01, 0.01, [&]() {
			t4 = Ev::Timer();
			return Ev::lift();
		});

		return sleep(0.2);
	}).then([&]() {
		assert(oneshot == 1);
		assert(!t1.active());
		assert(repeats == 3);
		assert(!t2.active());
		assert(cancelled == 0);
		assert(!t4.active());
		return Ev::lift(0);
	}));

	assert(code == 0);
	return code;
}
