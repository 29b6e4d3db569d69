#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>

namespace {

void on_idle(EV_P_ ev_idle* raw, int) {
	auto idler = std::unique_ptr<ev_idle>(raw);
	ev_idle_stop(EV_A_ idler.get());
	auto resume = std::unique_ptr<std::function<void()>>(
		(std::function<void()>*) idler->data
	);
	auto pass = std::move(*resume);

	resume = nullptr;
	idler = nullptr;

	pass();
}

}

namespace Ev {

Io<void> yield() {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)>
			  ) {
		auto resume = Util::make_unique<std::function<void()>>(
			std::move(pass)
		);
		auto idler = Util::make_unique<ev_idle>();
		ev_idle_init(idler.get(), &on_idle);
		idler->data = resume.release();
		ev_idle_start(EV_DEFAULT_ idler.release());
	});
}

Io<void> yield(std::size_t count) {
	if (count == 0)
		return Ev::lift();
	return yield().then([count]() {
		return yield(count - 1);
	});
}

}
