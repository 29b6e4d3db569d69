#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Streamer/Mod/JsonOutputter.hpp"
#include"Streamer/Msg/JsonCout.hpp"
#include"Streamer/concurrent.hpp"

namespace Streamer { namespace Mod {

JsonOutputter::JsonOutputter(std::ostream& cout_, S::Bus& bus) : cout(cout_) {
	bus.subscribe<Msg::JsonCout>([this](Msg::JsonCout const& j) {
		auto idle = outs.empty();
		outs.push(j.obj.output());
		if (!idle)
			return Ev::lift();
		return Streamer::concurrent(drain());
	});
}

Ev::Io<void> JsonOutputter::drain() {
	return Ev::yield().then([this]() {
		if (outs.empty()) {
			cout.flush();
			return Ev::lift();
		}
		/* lightningd wants a blank line between data.  */
		cout << outs.front() << "\n\n";
		outs.pop();
		return drain();
	});
}

}}
