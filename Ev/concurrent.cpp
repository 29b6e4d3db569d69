#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<iostream>

namespace {

void report(std::exception_ptr e) {
	std::cerr << "Ev::concurrent: unhandled exception in "
		  << "greenthread: ";
	try {
		std::rethrow_exception(e);
	} catch (std::exception const& err) {
		std::cerr << err.what();
	} catch (...) {
		std::cerr << "(unknown type)";
	}
	std::cerr << std::endl;
}

void on_idle(EV_P_ ev_idle* raw, int) {
	auto idler = std::unique_ptr<ev_idle>(raw);
	ev_idle_stop(EV_A_ idler.get());
	auto io = std::unique_ptr<Ev::Io<void>>((Ev::Io<void>*) idler->data);
	idler = nullptr;

	io->run([]() { }, &report);
}

}

namespace Ev {

Io<void> concurrent(Io<void> io) {
	return Io<void>([io]( std::function<void()> pass
			    , std::function<void(std::exception_ptr)> fail
			    ) {
		try {
			auto pio = Util::make_unique<Io<void>>(io);
			auto idler = Util::make_unique<ev_idle>();
			ev_idle_init(idler.get(), &on_idle);
			idler->data = pio.release();
			ev_idle_start(EV_DEFAULT_ idler.release());
		} catch (...) {
			fail(std::current_exception());
			return;
		}
		pass();
	});
}

}
