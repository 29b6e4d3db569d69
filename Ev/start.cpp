#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<iostream>

namespace {

struct Startup {
	Ev::Io<int> main;
	int exit_code;
};

void report(std::exception_ptr e) {
	try {
		std::rethrow_exception(e);
	} catch (std::exception const& err) {
		std::cerr << "Ev::start: unhandled exception: "
			  << err.what() << std::endl;
	} catch (...) {
		std::cerr << "Ev::start: unhandled exception "
			  << "of unknown type." << std::endl;
	}
}

void on_first_idle(EV_P_ ev_idle* raw, int) {
	auto idler = std::unique_ptr<ev_idle>(raw);
	ev_idle_stop(EV_A_ idler.get());

	auto startup = (Startup*) idler->data;
	idler = nullptr;

	startup->main.run([startup](int code) {
		startup->exit_code = code;
	}, [startup](std::exception_ptr e) {
		report(e);
		startup->exit_code = 254;
	});
}

}

namespace Ev {

int start(Io<int> main) {
	if (!ev_default_loop(0)) {
		std::cerr << "Ev::start: libev failed to initialize."
			  << std::endl;
		return 255;
	}

	auto startup = Startup{std::move(main), 255};

	auto idler = Util::make_unique<ev_idle>();
	ev_idle_init(idler.get(), &on_first_idle);
	idler->data = &startup;
	/* libev owns the idler until it fires.  */
	ev_idle_start(EV_DEFAULT_ idler.release());

	if (ev_run(EV_DEFAULT_ 0))
		std::cerr << "Ev::start: loop exited with watchers "
			  << "still active." << std::endl;

	return startup.exit_code;
}

}
