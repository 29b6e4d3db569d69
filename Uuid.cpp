#include"Util/Str.hpp"
#include"Uuid.hpp"
#include<algorithm>
#include<basicsecure.h>
#include<stdexcept>
#include<string.h>

namespace {

std::uint8_t const zero[16] = {0};

}

Uuid::Uuid() {
	memset(data, 0, sizeof(data));
}

Uuid Uuid::random() {
	auto ret = Uuid();
	BASICSECURE_RAND(ret.data, sizeof(ret.data));
	return ret;
}

Uuid::Uuid(std::string const& s) {
	if (!valid_string(s))
		throw Util::BacktraceException<std::invalid_argument>(
			"Uuid: not 32 hex digits: " + s
		);
	auto buf = Util::Str::hexread(s);
	std::copy(buf.begin(), buf.end(), data);
}
Uuid::operator std::string() const {
	return Util::Str::hexdump(data, sizeof(data));
}
bool Uuid::valid_string(std::string const& s) {
	return s.size() == 32 && Util::Str::ishex(s);
}

bool Uuid::operator==(Uuid const& o) const {
	return basicsecure_eq(data, o.data, sizeof(data));
}
Uuid::operator bool() const {
	return !basicsecure_eq(data, zero, sizeof(data));
}

std::size_t Uuid::hash() const {
	auto ret = std::size_t(0);
	for (auto b : data)
		ret = (ret * 131) ^ b;
	return ret;
}
