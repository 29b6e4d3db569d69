#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Streamer/Mod/CommandReceiver.hpp"
#include"Streamer/Msg/CommandFail.hpp"
#include"Streamer/Msg/CommandRequest.hpp"
#include"Streamer/Msg/CommandResponse.hpp"
#include"Streamer/Msg/JsonCin.hpp"
#include"Streamer/Msg/JsonCout.hpp"
#include"Streamer/concurrent.hpp"

namespace Streamer { namespace Mod {

bool CommandReceiver::take(std::string const& id) {
	auto it = pending.find(id);
	if (it == pending.end())
		return false;
	pending.erase(it);
	return true;
}

CommandReceiver::CommandReceiver(S::Bus& bus_) : bus(bus_) {
	bus.subscribe<Msg::JsonCin>([this](Msg::JsonCin const& m) {
		auto const& inp = m.obj;
		if (!inp.is_object() || !inp["method"].is_string())
			return Ev::lift();
		if (!inp.has("id"))
			return Ev::lift();
		auto id = inp["id"];
		if (!id.is_number() && !id.is_string())
			return Ev::lift();

		pending.insert(id.direct_text());
		return Streamer::concurrent(bus.raise(Msg::CommandRequest{
			std::string(inp["method"]), inp["params"], id
		}));
	});
	bus.subscribe<Msg::CommandResponse>([this](Msg::CommandResponse const& r) {
		if (!take(r.id.direct_text()))
			return Ev::lift();
		return bus.raise(Msg::JsonCout{Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", r.id)
				.field("result", r.response)
			.end_object()
		});
	});
	bus.subscribe<Msg::CommandFail>([this](Msg::CommandFail const& f) {
		if (!take(f.id.direct_text()))
			return Ev::lift();
		return bus.raise(Msg::JsonCout{Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", f.id)
				.start_object("error")
					.field("code", f.code)
					.field("message", f.message)
					.field("data", f.data)
				.end_object()
			.end_object()
		});
	});
}

}}
