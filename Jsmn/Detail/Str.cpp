#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/ParseError.hpp"
#include"Util/Str.hpp"
#include<cstdint>
#include<locale>
#include<sstream>

namespace {

void put_utf8(std::string& out, std::uint32_t cp) {
	if (cp < 0x80) {
		out.push_back(char(cp));
	} else if (cp < 0x800) {
		out.push_back(char(0xC0 | (cp >> 6)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	} else if (cp < 0x10000) {
		out.push_back(char(0xE0 | (cp >> 12)));
		out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	} else {
		out.push_back(char(0xF0 | (cp >> 18)));
		out.push_back(char(0x80 | ((cp >> 12) & 0x3F)));
		out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	}
}

std::uint32_t read_u16(std::string const& s, std::size_t& i) {
	if (i + 4 > s.size())
		throw Jsmn::ParseError(s, unsigned(i));
	auto bytes = std::vector<std::uint8_t>();
	try {
		bytes = Util::Str::hexread(s.substr(i, 4));
	} catch (Util::Str::HexParseFailure const&) {
		throw Jsmn::ParseError(s, unsigned(i));
	}
	i += 4;
	return (std::uint32_t(bytes[0]) << 8) | bytes[1];
}

}

namespace Jsmn { namespace Detail { namespace Str {

std::string to_escaped(std::string const& s) {
	static char const hex[] = "0123456789abcdef";
	auto out = std::string();
	out.reserve(s.size());
	for (auto c : s) {
		switch (c) {
		case '"': out += "\\\""; break;
		case '\\': out += "\\\\"; break;
		case '\b': out += "\\b"; break;
		case '\f': out += "\\f"; break;
		case '\n': out += "\\n"; break;
		case '\r': out += "\\r"; break;
		case '\t': out += "\\t"; break;
		default:
			if ((unsigned char) c < 0x20) {
				out += "\\u00";
				out.push_back(hex[(c >> 4) & 0xF]);
				out.push_back(hex[c & 0xF]);
			} else
				out.push_back(c);
		}
	}
	return out;
}

std::string from_escaped(std::string const& s) {
	auto out = std::string();
	out.reserve(s.size());
	auto i = std::size_t(0);
	while (i < s.size()) {
		auto c = s[i++];
		if (c != '\\') {
			out.push_back(c);
			continue;
		}
		if (i == s.size())
			throw ParseError(s, unsigned(i));
		c = s[i++];
		switch (c) {
		case '"': out.push_back('"'); break;
		case '\\': out.push_back('\\'); break;
		case '/': out.push_back('/'); break;
		case 'b': out.push_back('\b'); break;
		case 'f': out.push_back('\f'); break;
		case 'n': out.push_back('\n'); break;
		case 'r': out.push_back('\r'); break;
		case 't': out.push_back('\t'); break;
		case 'u': {
			auto cp = read_u16(s, i);
			/* Surrogate pair.  */
			if ( 0xD800 <= cp && cp < 0xDC00
			  && i + 6 <= s.size()
			  && s[i] == '\\' && s[i + 1] == 'u'
			   ) {
				i += 2;
				auto lo = read_u16(s, i);
				cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
			}
			put_utf8(out, cp);
			break;
		}
		default:
			throw ParseError(s, unsigned(i - 1));
		}
	}
	return out;
}

double to_double(std::string const& s) {
	auto is = std::istringstream(s);
	is.imbue(std::locale::classic());
	auto ret = double(0);
	is >> ret;
	return ret;
}
std::string from_double(double d) {
	auto os = std::ostringstream();
	os.imbue(std::locale::classic());
	os.precision(17);
	os << d;
	return os.str();
}

}}}
