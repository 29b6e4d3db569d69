#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ln/Amount.hpp"
#include"S/Bus.hpp"
#include"Streamer/Mod/StreamCommands.hpp"
#include"Streamer/Mod/StreamController.hpp"
#include"Streamer/Msg/CommandFail.hpp"
#include"Streamer/Msg/CommandRequest.hpp"
#include"Streamer/Msg/CommandResponse.hpp"
#include"Streamer/Msg/ManifestCommand.hpp"
#include"Streamer/Msg/Manifestation.hpp"
#include"Streamer/Msg/PaymentBackend.hpp"
#include"Streamer/PaymentClient.hpp"
#include<assert.h>
#include<map>
#include<set>

namespace {

class MockClient : public Streamer::PaymentClient {
public:
	Ev::Io<Ln::Amount> quote_fee( std::string const&
				    , Ln::Amount
				    ) override {
		return Ev::lift(Ln::Amount::msat(42));
	}
	Ev::Io<std::string> create_invoice( std::string const&
					  , Ln::Amount
					  , std::string const&
					  ) override {
		return Ev::lift(std::string("lni1invoice"));
	}
	Ev::Io<std::string> pay_invoice(std::string const&) override {
		return Ev::lift(std::string("ab01"));
	}
};

struct Failure {
	int code;
	Jsmn::Object data;
};

}

int main() {
	auto bus = S::Bus();
	auto client = MockClient();
	Streamer::Mod::StreamController controller(bus);
	auto commands = Streamer::Mod::StreamCommands(bus, controller);

	auto responses = std::map<std::string, Jsmn::Object>();
	auto failures = std::map<std::string, Failure>();
	bus.subscribe<Streamer::Msg::CommandResponse
		     >([&](Streamer::Msg::CommandResponse const& r) {
		auto text = r.response.output();
		responses[r.id.direct_text()] = Jsmn::Object::parse_json(text.c_str());
		return Ev::lift();
	});
	bus.subscribe<Streamer::Msg::CommandFail
		     >([&](Streamer::Msg::CommandFail const& f) {
		auto text = f.data.output();
		failures[f.id.direct_text()] = Failure{
			f.code, Jsmn::Object::parse_json(text.c_str())
		};
		return Ev::lift();
	});
	auto manifest = std::set<std::string>();
	bus.subscribe<Streamer::Msg::ManifestCommand
		     >([&](Streamer::Msg::ManifestCommand const& c) {
		manifest.insert(c.name);
		return Ev::lift();
	});

	auto next_id = 0;
	/* Sends the command and waits for its answer;
	 * returns the id used.  */
	auto call = [&](std::string command, std::string params) {
		auto id = std::to_string(++next_id);
		auto req = Streamer::Msg::CommandRequest{
			command,
			Jsmn::Object::parse_json(params.c_str()),
			Jsmn::Object::parse_json(id.c_str())
		};
		return bus.raise(std::move(req)).then([]() {
			return Ev::yield(10);
		}).then([id]() {
			return Ev::lift(id);
		});
	};
	auto expect_invalid = [&](std::string command, std::string params) {
		return call(command, params).then([&](std::string id) {
			assert(responses.count(id) == 0);
			assert(failures.count(id) == 1);
			assert(failures[id].code == -32602);
			assert(failures[id].data.has("params"));
			return Ev::lift();
		});
	};

	auto stream = std::string();

	auto code = Ev::lift().then([&]() {
		return bus.raise(Streamer::Msg::Manifestation());
	}).then([&]() {
		assert(manifest.size() == 7);
		assert(manifest.count("streamer-prepare") == 1);
		assert(manifest.count("streamer-clear") == 1);
		assert(manifest.count("streamer-commit") == 1);
		assert(manifest.count("streamer-start") == 1);
		assert(manifest.count("streamer-pause") == 1);
		assert(manifest.count("streamer-finish") == 1);
		assert(manifest.count("streamer-list") == 1);

		return call( "streamer-prepare"
			   , R"JSON({"counterparty": "lno1abc", "price": 1000})JSON"
			   );
	}).then([&](std::string id) {
		/* No backend yet.  */
		assert(failures.count(id) == 1);
		assert(failures[id].code == -1);
		assert(std::string(failures[id].data["error"]) == "NoBackendConnection");

		return bus.raise(Streamer::Msg::PaymentBackend{client});
	}).then([&]() {
		return call( "streamer-prepare"
			   , R"JSON({ "counterparty": "lno1abc"
				    , "price": "5000msat"
				    , "parts": 2
				    , "name": "Coffee"
				    })JSON"
			   );
	}).then([&](std::string id) {
		assert(responses.count(id) == 1);
		auto r = responses[id];
		assert(std::string(r["status"]) == "prepared");
		assert(std::string(r["counterparty"]) == "lno1abc");
		assert(std::string(r["name"]) == "Coffee");
		assert(double(r["price_msat"]) == 5000);
		assert(double(r["fee_msat"]) == 42);
		assert(double(r["delay_ms"]) == 1000);
		assert(double(r["total_parts"]) == 2);
		assert(double(r["parts_paid"]) == 0);

		/* Array form, defaults filled in.  */
		return call("streamer-prepare", R"JSON(["lno1def", 1000, 250])JSON");
	}).then([&](std::string id) {
		auto r = responses[id];
		assert(std::string(r["counterparty"]) == "lno1def");
		assert(double(r["delay_ms"]) == 250);
		assert(double(r["total_parts"]) == 1);
		assert(std::string(r["name"]) == "Stream payment");

		return expect_invalid("streamer-prepare", R"JSON({"counterparty": "lno1abc"})JSON")
		     + expect_invalid("streamer-prepare", R"JSON({"counterparty": "", "price": 1000})JSON")
		     + expect_invalid("streamer-prepare", R"JSON({"counterparty": "lno1abc", "price": 0})JSON")
		     + expect_invalid("streamer-prepare", R"JSON({"counterparty": "lno1abc", "price": 1000, "parts": 0})JSON")
		     + expect_invalid("streamer-prepare", R"JSON({"counterparty": "lno1abc", "price": 1000, "delay": -5})JSON")
		     + expect_invalid("streamer-prepare", R"JSON({"counterparty": "lno1abc", "price": 1000, "bogus": 1})JSON")
		     + expect_invalid("streamer-prepare", R"JSON(["lno1abc", 1000, 1, 1, "x", "extra"])JSON")
		     + expect_invalid("streamer-prepare", R"JSON("lno1abc")JSON")
		     + expect_invalid("streamer-clear", R"JSON([1])JSON")
		     ;
	}).then([&]() {
		return call("streamer-commit", "[]");
	}).then([&](std::string id) {
		auto r = responses[id];
		assert(std::string(r["status"]) == "paused");
		assert(std::string(r["counterparty"]) == "lno1def");
		stream = std::string(r["id"]);

		/* The draft is gone once committed.  */
		return call("streamer-commit", "{}");
	}).then([&](std::string id) {
		assert(failures[id].code == -1);
		assert(std::string(failures[id].data["error"]) == "MissingDraft");

		return call("streamer-prepare", R"JSON(["lno1ghi", 1000])JSON");
	}).then([&](std::string) {
		return call("streamer-clear", "{}");
	}).then([&](std::string id) {
		assert(responses[id].is_object());
		assert(responses[id].size() == 0);
		return call("streamer-commit", "{}");
	}).then([&](std::string id) {
		assert(std::string(failures[id].data["error"]) == "MissingDraft");

		return call("streamer-start", "{\"id\": \"" + stream + "\"}");
	}).then([&](std::string id) {
		assert(std::string(responses[id]["status"]) == "streaming");
		return call("streamer-pause", "[\"" + stream + "\"]");
	}).then([&](std::string id) {
		assert(std::string(responses[id]["status"]) == "paused");
		return call("streamer-finish", "[\"" + stream + "\"]");
	}).then([&](std::string id) {
		assert(std::string(responses[id]["status"]) == "finished");
		return call("streamer-start", "[\"" + stream + "\"]");
	}).then([&](std::string id) {
		assert(std::string(responses[id]["status"]) == "finished");

		/* Unknown ids are not errors.  */
		return call("streamer-pause", R"JSON(["nosuchstream"])JSON");
	}).then([&](std::string id) {
		assert(responses[id].is_object());
		assert(responses[id].size() == 0);

		return expect_invalid("streamer-start", "{}")
		     + expect_invalid("streamer-start", "[42]")
		     ;
	}).then([&]() {
		return call("streamer-list", "null");
	}).then([&](std::string id) {
		auto streams = responses[id]["streams"];
		assert(streams.is_array());
		assert(streams.size() == 1);
		assert(std::string(streams[std::size_t(0)]["id"]) == stream);

		/* Other commands are left to other modules.  */
		return call("getinfo", "{}");
	}).then([&](std::string id) {
		assert(responses.count(id) == 0);
		assert(failures.count(id) == 0);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
