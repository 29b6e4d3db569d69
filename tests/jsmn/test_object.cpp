#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include<assert.h>
#include<sstream>

int main() {
	auto js = Jsmn::Object::parse_json(R"JSON(
	{ "name": "stream"
	, "parts": 3
	, "ratio": -1.25e1
	, "on": true
	, "off": false
	, "nothing": null
	, "list": [1, "two", {"three": [3]}]
	}
	)JSON");

	assert(js.is_object());
	assert(js.size() == 7);
	assert(js.keys().size() == 7);
	assert(js.keys()[0] == "name");
	assert(js.has("parts"));
	assert(!js.has("missing"));

	assert(js["name"].is_string());
	assert(std::string(js["name"]) == "stream");
	assert(js["parts"].is_number());
	assert(double(js["parts"]) == 3);
	assert(double(js["ratio"]) == -12.5);
	assert(js["on"].is_boolean());
	assert(bool(js["on"]));
	assert(!bool(js["off"]));
	assert(js["nothing"].is_null());
	assert(!bool(js["nothing"]));

	/* Missing keys and indices are null.  */
	assert(js["missing"].is_null());
	assert(js["list"][std::size_t(7)].is_null());

	/* Iteration.  */
	auto count = std::size_t(0);
	for (auto e : js["list"]) {
		(void) e;
		++count;
	}
	assert(count == 3);
	assert(js["list"][std::size_t(2)]["three"][std::size_t(0)].direct_text() == "3");

	/* Text as it appeared.  */
	assert(js["name"].direct_text() == "\"stream\"");
	assert(Jsmn::Object().direct_text() == "null");

	/* Compact printing.  */
	{
		auto os = std::ostringstream();
		os << js["list"];
		assert(os.str() == R"JSON([1,"two",{"three":[3]}])JSON");
	}

	/* Wrong types.  */
	auto flag = false;
	try {
		auto tmp = double(js["name"]);
		(void) tmp;
	} catch (Jsmn::TypeError const&) {
		flag = true;
	}
	assert(flag);
	flag = false;
	try {
		auto tmp = std::string(js["parts"]);
		(void) tmp;
	} catch (Jsmn::TypeError const&) {
		flag = true;
	}
	assert(flag);
	flag = false;
	try {
		auto tmp = js["name"].size();
		(void) tmp;
	} catch (Jsmn::TypeError const&) {
		flag = true;
	}
	assert(flag);

	/* Exactly one datum.  */
	assert(double(Jsmn::Object::parse_json("42")) == 42);
	flag = false;
	try {
		Jsmn::Object::parse_json("1 2");
	} catch (Jsmn::ParseError const&) {
		flag = true;
	}
	assert(flag);

	return 0;
}
