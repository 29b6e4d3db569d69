#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Net/Fd.hpp"
#include"Streamer/Main.hpp"
#include<assert.h>
#include<iostream>
#include<set>
#include<sstream>
#include<stdexcept>

/* Test that getmanifest causes Streamer::Main to
 * emit the commands, options and notifications we
 * expect.
 */
namespace {
auto const expected_commands = std::vector<std::string>
{ "streamer-prepare"
, "streamer-clear"
, "streamer-commit"
, "streamer-start"
, "streamer-pause"
, "streamer-finish"
, "streamer-list"
};
auto const expected_options = std::vector<std::string>
{ "streamer-error-timeout"
};
auto const expected_notifications = std::vector<std::string>
{ "streamer_progress"
, "streamer_error"
};
}

int main() {
	auto argv = std::vector<std::string>{"clstreamer"};

	/* Send a single getmanifest command.  */
	auto cin = std::stringstream(R"JSON(
	{"jsonrpc": "2.0", "id": 0, "method": "getmanifest", "params": {}}
	)JSON");
	auto cout = std::stringstream("");
	auto cerr = std::stringstream("");

	auto dummy_open_rpc_socket = []( std::string const&
				       , std::string const&
				       ) -> Net::Fd {
		throw std::runtime_error("Should not be called");
	};
	auto main = Streamer::Main( argv, cin, cout, cerr
				  , dummy_open_rpc_socket
				  );

	auto ec = Ev::start(main.run());
	assert(ec == 0);

	std::cout << cout.str() << std::endl;

	Jsmn::Parser parser;
	auto output = parser.feed(cout.str());
	/* Log notifications may precede the response.  */
	auto response = Jsmn::Object();
	for (auto const& o : output) {
		assert(o.is_object());
		if (o.has("result"))
			response = o;
		else
			assert(std::string(o["method"]) == "log");
	}
	assert(response.is_object());
	assert(response["id"].is_number());
	assert(double(response["id"]) == 0);
	auto result = response["result"];
	assert(result.is_object());
	assert(result["dynamic"].is_boolean());
	assert(!bool(result["dynamic"]));

	auto names = [](Jsmn::Object arr, char const* key) {
		assert(arr.is_array());
		auto ret = std::set<std::string>();
		for (auto e : arr) {
			assert(e.is_object());
			assert(e.has(key));
			assert(e[key].is_string());
			ret.emplace(std::string(e[key]));
		}
		return ret;
	};
	auto commands = names(result["rpcmethods"], "name");
	auto options = names(result["options"], "name");
	auto notifications = names(result["notifications"], "method");

	assert(commands.size() == expected_commands.size());
	for (auto const& c : expected_commands)
		assert(commands.count(c) == 1);
	for (auto const& o : expected_options)
		assert(options.count(o) == 1);
	for (auto const& n : expected_notifications)
		assert(notifications.count(n) == 1);

	/* Each rpcmethod carries usage and description.  */
	for (auto m : result["rpcmethods"]) {
		assert(m["usage"].is_string());
		assert(m["description"].is_string());
	}
	for (auto o : result["options"]) {
		if (std::string(o["name"]) != "streamer-error-timeout")
			continue;
		assert(std::string(o["type"]) == "int");
		assert(double(o["default"]) == 30);
	}

	return 0;
}
