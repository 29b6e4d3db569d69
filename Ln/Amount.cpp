#include"Jsmn/Object.hpp"
#include"Ln/Amount.hpp"
#include"Util/BacktraceException.hpp"
#include<algorithm>
#include<cmath>
#include<stdexcept>

namespace {

bool all_digits(std::string::const_iterator b, std::string::const_iterator e) {
	return std::all_of(b, e, [](char c) { return '0' <= c && c <= '9'; });
}

}

namespace Ln {

bool Amount::valid_string(std::string const& s) {
	/* At least one digit then "msat".  */
	if (s.size() < 5 || s.compare(s.size() - 4, 4, "msat") != 0)
		return false;
	/* 19 digits always fit in 64 bits.  */
	if (s.size() - 4 > 19)
		return false;
	return all_digits(s.begin(), s.end() - 4);
}

Amount::Amount(std::string const& s) : v(0) {
	if (!valid_string(s))
		throw Util::BacktraceException<std::invalid_argument>(
			"Ln::Amount: invalid amount string: " + s
		);
	for (auto it = s.begin(); it != s.end() - 4; ++it)
		v = v * 10 + std::uint64_t(*it - '0');
}
Amount::operator std::string() const {
	return std::to_string(v) + "msat";
}

bool Amount::valid_object(Jsmn::Object const& o) {
	if (o.is_string())
		return valid_string(std::string(o));
	if (!o.is_number())
		return false;
	auto text = o.direct_text();
	return !text.empty() && text.size() <= 19
	    && all_digits(text.begin(), text.end())
	     ;
}
Amount Amount::object(Jsmn::Object const& o) {
	if (!valid_object(o))
		throw Util::BacktraceException<std::invalid_argument>(
			"Ln::Amount: invalid amount in JSON"
		);
	if (o.is_string())
		return Amount(std::string(o));
	return Amount(o.direct_text() + "msat");
}

}
