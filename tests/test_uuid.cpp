#undef NDEBUG
#include"Uuid.hpp"
#include<assert.h>
#include<sstream>
#include<unordered_set>

int main() {
	auto a = Uuid();
	auto b = Uuid();
	assert(a == b);
	assert(!a);

	a = Uuid::random();
	assert(a); /* With very high probability, at least.  */
	assert(a != b);
	b = a;
	assert(a == b);
	assert(std::hash<Uuid>()(a) == std::hash<Uuid>()(b));

	/* Round trip through text.  */
	auto text = std::string(a);
	assert(text.size() == 32);
	assert(Uuid::valid_string(text));
	assert(Uuid(text) == a);

	a = Uuid("00112233445566778899aabbccddeeff");
	assert(std::string(a) == "00112233445566778899aabbccddeeff");
	assert(Uuid("00112233445566778899AABBCCDDEEFF") == a);
	assert(a != Uuid("00112233445566778899aabbccddeefe"));
	{
		auto os = std::ostringstream();
		os << a;
		assert(os.str() == "00112233445566778899aabbccddeeff");
	}

	assert(!Uuid::valid_string(""));
	assert(!Uuid::valid_string("0011"));
	assert(!Uuid::valid_string("00112233445566778899aabbccddeefg"));

	/* Fresh ids do not collide.  */
	auto seen = std::unordered_set<Uuid>();
	for (auto i = 0; i < 100; ++i)
		seen.insert(Uuid::random());
	assert(seen.size() == 100);

	return 0;
}
