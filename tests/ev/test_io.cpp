#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<stdexcept>

int main() {
	auto order = std::string();

	/* Sequencing.  */
	auto act = Ev::lift();
	act += Ev::lift().then([&]() {
		order += "a";
		return Ev::lift();
	});
	act = std::move(act) + Ev::yield().then([&]() {
		order += "b";
		return Ev::lift();
	});
	act += Ev::lift().then([&]() {
		order += "c";
		return Ev::lift();
	});

	/* Building the action runs nothing.  */
	assert(order == "");

	auto caught = false;
	auto passed_through = false;
	auto code = Ev::start(std::move(act).then([&]() {
		assert(order == "abc");

		/* Thrown from inside a `then`.  */
		return Ev::yield().then([]() {
			throw std::runtime_error("bad");
			return Ev::lift(1);
		}).catching<std::runtime_error>([&](std::runtime_error const& e) {
			caught = (std::string(e.what()) == "bad");
			return Ev::lift(2);
		});
	}).then([&](int x) {
		assert(x == 2);
		assert(caught);

		/* Handlers for other types do not
		 * intercept.  */
		return Ev::lift().then([]() {
			throw std::invalid_argument("wrong");
			return Ev::lift(1);
		}).catching<std::out_of_range>([](std::out_of_range const&) {
			assert(false);
			return Ev::lift(3);
		}).catching<std::invalid_argument>([&](std::invalid_argument const&) {
			passed_through = true;
			return Ev::lift(4);
		});
	}).then([&](int x) {
		assert(x == 4);
		assert(passed_through);
		return Ev::lift(0);
	}));

	assert(code == 0);
	return code;
}
