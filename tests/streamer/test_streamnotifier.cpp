#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Streamer/Mod/StreamNotifier.hpp"
#include"Streamer/Msg/JsonCout.hpp"
#include"Streamer/Msg/ManifestCustomNotification.hpp"
#include"Streamer/Msg/Manifestation.hpp"
#include"Streamer/Msg/StreamError.hpp"
#include"Streamer/Msg/StreamProgress.hpp"
#include<assert.h>
#include<vector>

int main() {
	auto bus = S::Bus();
	Streamer::Mod::StreamNotifier notifier(bus);

	auto topics = std::vector<std::string>();
	bus.subscribe<Streamer::Msg::ManifestCustomNotification
		     >([&](Streamer::Msg::ManifestCustomNotification const& m) {
		topics.push_back(m.name);
		return Ev::lift();
	});
	auto notifications = std::vector<Jsmn::Object>();
	auto logs = std::vector<Jsmn::Object>();
	bus.subscribe<Streamer::Msg::JsonCout
		     >([&](Streamer::Msg::JsonCout const& m) {
		auto js = Jsmn::Object::parse_json(m.obj.output().c_str());
		assert(std::string(js["jsonrpc"]) == "2.0");
		if (std::string(js["method"]) == "log")
			logs.push_back(js);
		else
			notifications.push_back(js);
		return Ev::lift();
	});

	auto code = Ev::lift().then([&]() {
		return bus.raise(Streamer::Msg::Manifestation());
	}).then([&]() {
		assert(topics.size() == 2);
		assert(topics[0] == "streamer_progress");
		assert(topics[1] == "streamer_error");

		return bus.raise(Streamer::Msg::StreamProgress{"s1", 2, 5});
	}).then([&]() {
		assert(logs.size() == 1);
		assert(std::string(logs[0]["params"]["level"]) == "info");
		assert(notifications.size() == 1);
		auto n = notifications[0];
		assert(std::string(n["method"]) == "streamer_progress");
		assert(std::string(n["params"]["stream_id"]) == "s1");
		assert(double(n["params"]["parts_paid"]) == 2);
		assert(double(n["params"]["total_parts"]) == 5);

		return bus.raise(Streamer::Msg::StreamError{
			"stream_error", "s1", "RemoteOffline",
			"Counterparty is offline."
		});
	}).then([&]() {
		assert(logs.size() == 2);
		assert(std::string(logs[1]["params"]["level"]) == "error");
		assert(notifications.size() == 2);
		auto p = notifications[1]["params"];
		assert(std::string(notifications[1]["method"]) == "streamer_error");
		assert(std::string(p["category"]) == "stream_error");
		assert(std::string(p["stream_id"]) == "s1");
		assert(std::string(p["error"]) == "RemoteOffline");
		assert(std::string(p["message"]) == "Counterparty is offline.");
		return Ev::lift(0);
	});

	return Ev::start(code);
}
