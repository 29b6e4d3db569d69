#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include<assert.h>

int main() {
	Jsmn::Parser p;
	assert(p.empty());

	/* Should work across feeds.  */
	{
		auto res = p.feed("[");
		assert(res.size() == 0);
		assert(!p.empty());
	}
	{
		auto res = p.feed("]");
		assert(res.size() == 1);
		assert(res[0].is_array());
		assert(res[0].size() == 0);
		assert(p.empty());
	}

	/* Several data in one feed.  */
	{
		auto res = p.feed(R"JSON(
			"""" """ "
		)JSON");
		assert(res.size() == 4);
		assert(std::string(res[0]) == "");
		assert(std::string(res[1]) == "");
		assert(std::string(res[2]) == "");
		assert(std::string(res[3]) == " ");
	}

	/* A number ends only at whitespace.  */
	{
		auto res = p.feed("9");
		assert(res.size() == 0);
	}
	{
		auto res = p.feed(" 42");
		assert(res.size() == 1);
		assert(double(res[0]) == 9);
	}
	{
		auto res = p.feed(".5\n");
		assert(res.size() == 1);
		assert(double(res[0]) == 42.5);
	}

	/* Lines as lightningd sends them.  */
	{
		auto res = p.feed(R"JSON({"jsonrpc":"2.0","id":1,)JSON");
		assert(res.size() == 0);
	}
	{
		auto res = p.feed(R"JSON("method":"getmanifest","params":{}})JSON"
				  "\n\n");
		assert(res.size() == 1);
		assert(res[0].is_object());
		assert(std::string(res[0]["method"]) == "getmanifest");
		assert(res[0]["params"].is_object());
		assert(res[0]["params"].size() == 0);
		assert(res[0]["id"].direct_text() == "1");
	}

	/* Brackets and escapes inside strings.  */
	{
		auto res = p.feed(R"JSON(
			{
				"array": [
					"}\\[[\"",
					"café 😀"
				]
			}
		)JSON");
		assert(res.size() == 1);
		auto arr = res[0]["array"];
		assert(arr.is_array());
		assert(arr.size() == 2);
		assert(std::string(arr[std::size_t(0)]) == "}\\[[\"");
		assert(std::string(arr[std::size_t(1)]) == "caf\xc3\xa9 \xf0\x9f\x98\x80");
	}

	/* Malformed input.  */
	{
		Jsmn::Parser bad;
		auto flag = false;
		try {
			bad.feed("{\"a\" 1}");
		} catch (Jsmn::ParseError const&) {
			flag = true;
		}
		assert(flag);
	}

	return 0;
}
