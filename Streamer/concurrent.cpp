#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Streamer/Shutdown.hpp"
#include"Streamer/concurrent.hpp"

namespace Streamer {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::concurrent(io.catching<Streamer::Shutdown>([](Streamer::Shutdown const&) {
		return Ev::lift();
	}));
}

}
