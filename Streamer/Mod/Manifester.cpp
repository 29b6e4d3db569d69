#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Streamer/Mod/Manifester.hpp"
#include"Streamer/Msg/CommandRequest.hpp"
#include"Streamer/Msg/CommandResponse.hpp"
#include"Streamer/Msg/ManifestCustomNotification.hpp"
#include"Streamer/Msg/Manifestation.hpp"

namespace {

char const* type_name(Streamer::Msg::OptionType t) {
	switch (t) {
	case Streamer::Msg::OptionType_String: return "string";
	case Streamer::Msg::OptionType_Bool: return "bool";
	case Streamer::Msg::OptionType_Int: return "int";
	case Streamer::Msg::OptionType_Flag: return "flag";
	}
	return "string";
}

}

namespace Streamer { namespace Mod {

void Manifester::start() {
	bus.subscribe<Msg::CommandRequest>([this](Msg::CommandRequest const& req) {
		if (req.command != "getmanifest")
			return Ev::lift();

		auto id = req.id;
		return bus.raise(Msg::Manifestation()).then([this, id]() {
			auto result = Json::Out();
			auto top = result.start_object();
			top.field("dynamic", false);

			auto cmds = top.start_array("rpcmethods");
			for (auto const& c : commands)
				cmds.start_object()
					.field("name", c.second.name)
					.field("usage", c.second.usage)
					.field("description", c.second.description)
					.field("deprecated", c.second.deprecated)
				.end_object();
			cmds.end_array();

			auto opts = top.start_array("options");
			for (auto const& o : options)
				opts.start_object()
					.field("name", o.second.name)
					.field("type", std::string(type_name(o.second.type)))
					.field("default", o.second.default_value)
					.field("description", o.second.description)
				.end_object();
			opts.end_array();

			auto notifs = top.start_array("notifications");
			for (auto const& n : notifications)
				notifs.start_object()
					.field("method", n)
				.end_object();
			notifs.end_array();

			top.start_array("subscriptions").end_array();
			top.start_array("hooks").end_array();
			top.end_object();

			commands.clear();
			options.clear();
			notifications.clear();

			return bus.raise(Msg::CommandResponse{id, result});
		});
	});

	bus.subscribe<Msg::ManifestCommand>([this](Msg::ManifestCommand const& c) {
		commands[c.name] = c;
		return Ev::lift();
	});
	bus.subscribe<Msg::ManifestOption>([this](Msg::ManifestOption const& o) {
		options[o.name] = o;
		return Ev::lift();
	});
	bus.subscribe<Msg::ManifestCustomNotification>([this](Msg::ManifestCustomNotification const& n) {
		notifications.insert(n.name);
		return Ev::lift();
	});
}

}}
