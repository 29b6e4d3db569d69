#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Streamer/Msg/JsonCout.hpp"
#include"Streamer/log.hpp"
#include"Util/Str.hpp"
#include<stdarg.h>

namespace {

char const* level_name(Streamer::LogLevel l) {
	switch (l) {
	case Streamer::Trace: return "trace";
	case Streamer::Debug: return "debug";
	case Streamer::Info: return "info";
	case Streamer::Warn: return "warn";
	case Streamer::Error: return "error";
	}
	return "info";
}

}

namespace Streamer {

Ev::Io<void> log(S::Bus& bus, LogLevel l, char const* fmt, ...) {
	va_list ap;
	va_start(ap, fmt);
	auto msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	auto js = Json::Out()
		.start_object()
			.field("jsonrpc", std::string("2.0"))
			.field("method", std::string("log"))
			.start_object("params")
				.field("level", std::string(level_name(l)))
				.field("message", msg)
			.end_object()
		.end_object()
		;
	return bus.raise(Msg::JsonCout{std::move(js)});
}

}
