#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Ln/Amount.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>

int main() {
	assert(Ln::Amount::msat(42) == Ln::Amount("42msat"));
	assert(Ln::Amount::sat(42) == Ln::Amount::msat(42000));
	assert(Ln::Amount::msat(100).to_msat() == 100);
	assert(Ln::Amount() == Ln::Amount::msat(0));

	auto a = Ln::Amount::sat(547);
	auto b = Ln::Amount::msat(99999);
	assert(a > b);
	assert(b < a);
	b = a;
	assert(a == b);
	assert(a + b >= b);
	assert(a + b == b + a);
	assert(a - b == Ln::Amount("0msat"));

	/* Saturating.  */
	assert(Ln::Amount::msat(5) - Ln::Amount::msat(7) == Ln::Amount());
	assert( Ln::Amount::msat(UINT64_MAX) + Ln::Amount::msat(1)
	     == Ln::Amount::msat(UINT64_MAX)
	      );

	{
		auto os = std::ostringstream();
		os << a + b;
		assert(os.str() == "1094000msat");
	}

	assert(Ln::Amount::valid_string("0msat"));
	assert(!Ln::Amount::valid_string("msat"));
	assert(!Ln::Amount::valid_string("12sat"));
	assert(!Ln::Amount::valid_string("-1msat"));
	assert(!Ln::Amount::valid_string("99999999999999999999msat"));

	auto flag = false;
	try {
		auto tmp = Ln::Amount("garbage");
		(void) tmp;
		assert(false);
	} catch (std::invalid_argument const&) {
		flag = true;
	}
	assert(flag);

	/* From lightningd JSON, either form.  */
	auto js = Jsmn::Object::parse_json(R"JSON(
	[1000, "2000msat", 1.5, -3, "3000", null]
	)JSON");
	assert(Ln::Amount::valid_object(js[std::size_t(0)]));
	assert(Ln::Amount::object(js[std::size_t(0)]) == Ln::Amount::msat(1000));
	assert(Ln::Amount::valid_object(js[std::size_t(1)]));
	assert(Ln::Amount::object(js[std::size_t(1)]) == Ln::Amount::msat(2000));
	assert(!Ln::Amount::valid_object(js[std::size_t(2)]));
	assert(!Ln::Amount::valid_object(js[std::size_t(3)]));
	assert(!Ln::Amount::valid_object(js[std::size_t(4)]));
	assert(!Ln::Amount::valid_object(js[std::size_t(5)]));

	flag = false;
	try {
		Ln::Amount::object(js[std::size_t(2)]);
	} catch (std::invalid_argument const&) {
		flag = true;
	}
	assert(flag);

	return 0;
}
