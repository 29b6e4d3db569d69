#undef NDEBUG
#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<Ev/yield.hpp>
#include<S/Bus.hpp>
#include<assert.h>
#include<memory>
#include<string>

namespace {

struct Ping {
	int n;
};
struct Pong {
	std::string text;
};

}

Ev::Io<void> io_main() {
	auto bus = std::make_shared<S::Bus>();
	auto pings = std::make_shared<int>(0);
	auto last_pong = std::make_shared<std::string>();
	auto slow_done = std::make_shared<bool>(false);
	return Ev::yield().then([=]() {
		/* Nobody listening: benign.  */
		return bus->raise(Ping{1});
	}).then([=]() {
		bus->subscribe<Ping>([=](Ping const& p) {
			*pings += p.n;
			return Ev::lift();
		});
		return bus->raise(Ping{2});
	}).then([=]() {
		assert(*pings == 2);

		/* Types are strict.  */
		return bus->raise(Pong{"hello"});
	}).then([=]() {
		assert(*pings == 2);

		/* Subscribers may raise in turn.  */
		bus->subscribe<Pong>([=](Pong const& p) {
			*last_pong = p.text;
			return bus->raise(Ping{10});
		});
		return bus->raise(Pong{"world"});
	}).then([=]() {
		assert(*last_pong == "world");
		assert(*pings == 12);

		/* raise completes only after every
		 * subscriber has.  */
		bus->subscribe<Ping>([=](Ping const&) {
			return Ev::yield(3).then([=]() {
				*slow_done = true;
				return Ev::lift();
			});
		});
		return bus->raise(Ping{1});
	}).then([=]() {
		assert(*slow_done);
		assert(*pings == 13);
		return Ev::lift();
	});
}

int main() {
	return Ev::start(io_main().then([](){
		return Ev::lift(0);
	}));
}
