#include"Util/Str.hpp"
#include<algorithm>
#include<cctype>
#include<stdio.h>

namespace {

char const hexdigits[] = "0123456789abcdef";

std::uint8_t nibble(char c) {
	if ('0' <= c && c <= '9')
		return std::uint8_t(c - '0');
	if ('a' <= c && c <= 'f')
		return std::uint8_t(c - 'a' + 10);
	if ('A' <= c && c <= 'F')
		return std::uint8_t(c - 'A' + 10);
	throw Util::Str::HexParseFailure(
		std::string("Non-hex character: ") + c
	);
}

bool is_space(char c) {
	return std::isspace((unsigned char) c) != 0;
}

}

namespace Util {
namespace Str {

std::string hexdump(void const* vp, std::size_t s) {
	auto p = (std::uint8_t const*) vp;
	auto ret = std::string();
	ret.reserve(s * 2);
	for (auto i = std::size_t(0); i < s; ++i) {
		ret.push_back(hexdigits[p[i] >> 4]);
		ret.push_back(hexdigits[p[i] & 0xF]);
	}
	return ret;
}

std::vector<std::uint8_t> hexread(std::string const& s) {
	if ((s.size() % 2) != 0)
		throw HexParseFailure("String length must be even.");
	auto ret = std::vector<std::uint8_t>(s.size() / 2);
	for (auto i = std::size_t(0); i < ret.size(); ++i)
		ret[i] = (nibble(s[2 * i]) << 4) | nibble(s[2 * i + 1]);
	return ret;
}

bool ishex(std::string const& s) {
	if ((s.size() % 2) != 0)
		return false;
	return std::all_of(s.begin(), s.end(), [](char c) {
		return std::isxdigit((unsigned char) c) != 0;
	});
}

std::string trim(std::string const& s) {
	auto b = std::find_if_not(s.begin(), s.end(), is_space);
	if (b == s.end())
		return "";
	auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
	return std::string(b, e);
}

std::string lowercase(std::string s) {
	for (auto& c : s)
		c = char(std::tolower((unsigned char) c));
	return s;
}

std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto ret = vfmt(tpl, ap);
	va_end(ap);
	return ret;
}

std::string vfmt(char const* tpl, va_list ap) {
	/* Measure first, then format into the string.  */
	va_list measure;
	va_copy(measure, ap);
	auto len = vsnprintf(nullptr, 0, tpl, measure);
	va_end(measure);
	if (len < 0)
		throw std::runtime_error("Util::Str::vfmt: bad template.");

	auto buf = std::vector<char>(std::size_t(len) + 1);
	vsnprintf(&buf[0], buf.size(), tpl, ap);
	return std::string(&buf[0], std::size_t(len));
}

}}
