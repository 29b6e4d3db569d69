#undef NDEBUG
#include"Util/Str.hpp"
#include<assert.h>

int main() {
	assert(Util::Str::fmt("foo") == "foo");
	assert(Util::Str::fmt("foo %d", 42) == "foo 42");
	assert(Util::Str::fmt("%zu of %zu", std::size_t(1), std::size_t(3)) == "1 of 3");
	assert(Util::Str::fmt("foo %s batz", "bar") == "foo bar batz");
	/* Longer than any fixed buffer.  */
	assert(Util::Str::fmt("%s", std::string(5000, 'x').c_str()).size() == 5000);

	assert(Util::Str::hexdump("\x01\xab", 2) == "01ab");
	assert(Util::Str::hexread("01AB") == std::vector<std::uint8_t>({1, 0xab}));
	assert(Util::Str::ishex("00ff"));
	assert(!Util::Str::ishex("0ff"));
	assert(!Util::Str::ishex("0g"));
	auto flag = false;
	try {
		Util::Str::hexread("zz");
	} catch (Util::Str::HexParseFailure const&) {
		flag = true;
	}
	assert(flag);

	assert(Util::Str::trim("  a b \n") == "a b");
	assert(Util::Str::trim(" \t ") == "");
	assert(Util::Str::lowercase("Invalid JSON Response") == "invalid json response");

	return 0;
}
