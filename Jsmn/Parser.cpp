#include"Jsmn/Detail/DatumIdentifier.hpp"
#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Detail/Token.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Util/make_unique.hpp"
#include<cctype>

/* jsmn is a single header; its code is compiled here only.  */
#define JSMN_STATIC 1
#undef JSMN_HEADER
#define JSMN_PARENT_LINKS 1
#define JSMN_STRICT 1
#include<jsmn.h>

namespace {

Jsmn::Detail::Type convert(jsmntype_t t) {
	switch (t) {
	case JSMN_OBJECT: return Jsmn::Detail::Object;
	case JSMN_ARRAY: return Jsmn::Detail::Array;
	case JSMN_STRING: return Jsmn::Detail::String;
	case JSMN_PRIMITIVE: return Jsmn::Detail::Primitive;
	default: return Jsmn::Detail::Undefined;
	}
}

bool blank(std::string const& s, std::size_t from, std::size_t to) {
	for (auto i = from; i < to; ++i)
		if (!std::isspace((unsigned char) s[i]))
			return false;
	return true;
}

}

namespace Jsmn {

class Parser::Impl {
private:
	/* Unconsumed input.  */
	std::string buf;
	/* How much of buf the identifier has seen.  */
	std::size_t scanned;
	Detail::DatumIdentifier ident;
	std::vector<jsmntok_t> toks;

	/* Parses buf[0, end) which should hold one datum.  */
	Jsmn::Object parse_prefix(std::size_t end) {
		for (;;) {
			jsmn_parser p;
			jsmn_init(&p);
			auto res = jsmn_parse( &p, buf.data(), end
					     , &toks[0], unsigned(toks.size())
					     );
			if (res == JSMN_ERROR_NOMEM) {
				toks.resize(toks.size() * 2);
				continue;
			}
			if (res < 0)
				throw ParseError(buf, p.pos);

			auto r = std::make_shared<Detail::ParseResult>();
			r->text = buf.substr(0, end);
			r->tokens.reserve(std::size_t(res));
			for (auto i = 0; i < res; ++i) {
				auto t = Detail::Token();
				t.type = convert(toks[i].type);
				t.start = toks[i].start;
				t.end = toks[i].end;
				t.size = toks[i].size;
				r->tokens.push_back(t);
			}
			return Jsmn::Object(std::move(r), 0);
		}
	}

public:
	Impl() : scanned(0), toks(64) { }

	void feed(std::string const& s, std::vector<Jsmn::Object>& out) {
		buf += s;
		while (scanned < buf.size()) {
			if (!ident.feed(buf[scanned++]))
				continue;
			if (blank(buf, 0, scanned))
				continue;
			out.push_back(parse_prefix(scanned));
			buf.erase(0, scanned);
			scanned = 0;
			ident = Detail::DatumIdentifier();
		}
	}
	bool empty() const {
		return blank(buf, 0, buf.size());
	}
};

Parser::Parser() : pimpl(Util::make_unique<Impl>()) { }
Parser::Parser(Parser&& o) : pimpl(std::move(o.pimpl)) { }
Parser::~Parser() { }

std::vector<Jsmn::Object> Parser::feed(std::string const& s) {
	auto ret = std::vector<Jsmn::Object>();
	pimpl->feed(s, ret);
	return ret;
}
bool Parser::empty() const {
	return pimpl->empty();
}

}
