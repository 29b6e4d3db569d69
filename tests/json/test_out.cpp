#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include<assert.h>
#include<cstdint>

int main() {
	{
		auto s = Json::Out()
			.start_object()
				.field("number", 42)
				.field("big", std::uint64_t(18446744073709551615ULL))
				.field("text", std::string("a \"quoted\"\nline"))
				.field("flag", false)
				.field("none", nullptr)
			.end_object()
			.output()
			;

		auto jsmn = Jsmn::Object::parse_json(s.c_str());
		assert(jsmn.is_object());
		assert(jsmn.size() == 5);
		assert(double(jsmn["number"]) == 42);
		assert(jsmn["big"].direct_text() == "18446744073709551615");
		assert(std::string(jsmn["text"]) == "a \"quoted\"\nline");
		assert(jsmn["flag"].is_boolean());
		assert(!bool(jsmn["flag"]));
		assert(jsmn["none"].is_null());
	}

	{
		auto js = Json::Out();
		auto obj = js.start_object();
		auto arr = obj.start_array("parts");
		for (auto i = 0; i < 8; ++i)
			arr.entry(i);
		arr.end_array();
		obj.start_object("nested")
			.start_array("empty")
			.end_array()
		.end_object();
		obj.end_object();

		auto jsmn = Jsmn::Object::parse_json(js.output().c_str());
		assert(jsmn["parts"].size() == 8);
		for (auto i = std::size_t(0); i < 8; ++i)
			assert(double(jsmn["parts"][i]) == double(i));
		assert(jsmn["nested"]["empty"].is_array());
		assert(jsmn["nested"]["empty"].size() == 0);
	}

	/* Embedding other values.  */
	{
		auto inner = Json::Out()
			.start_array()
				.entry(1.5)
				.entry("x")
			.end_array()
			;
		auto parsed = Jsmn::Object::parse_json(R"JSON({"k": [true, null]})JSON");
		auto s = Json::Out()
			.start_object()
				.field("inner", inner)
				.field("parsed", parsed)
			.end_object()
			.output()
			;
		auto jsmn = Jsmn::Object::parse_json(s.c_str());
		assert(double(jsmn["inner"][std::size_t(0)]) == 1.5);
		assert(std::string(jsmn["inner"][std::size_t(1)]) == "x");
		assert(bool(jsmn["parsed"]["k"][std::size_t(0)]));
		assert(jsmn["parsed"]["k"][std::size_t(1)].is_null());
	}

	assert(Json::Out::empty_object().output() == "{}");
	assert(Json::Out::direct(30).output() == "30");

	return 0;
}
