#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Detail/Token.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"

namespace Jsmn {

class Object::Impl {
private:
	std::shared_ptr<Detail::ParseResult> r;
	std::size_t i;

	std::string slice(Detail::Token const& t) const {
		return r->text.substr( std::size_t(t.start)
				     , std::size_t(t.end - t.start)
				     );
	}
	/* Key token of the given object, and the value after it.  */
	template<typename F>
	void each_member(F f) const {
		auto& t = token();
		if (t.type != Detail::Object)
			throw TypeError();
		auto p = &t + 1;
		for (auto n = 0; n < t.size; ++n) {
			auto key = Detail::Str::from_escaped(slice(*p));
			auto value = p + 1;
			if (f(key, value))
				return;
			Detail::Token::next(p);
		}
	}

public:
	Impl(std::shared_ptr<Detail::ParseResult> r_, std::size_t i_)
		: r(std::move(r_)), i(i_) { }

	Detail::Token const& token() const { return r->tokens[i]; }
	char lead() const { return r->text[std::size_t(token().start)]; }
	std::string text() const { return slice(token()); }

	std::string string() const {
		if (token().type != Detail::String)
			throw TypeError();
		return Detail::Str::from_escaped(text());
	}

	std::vector<std::string> keys() const {
		auto ret = std::vector<std::string>();
		each_member([&ret](std::string const& k, Detail::Token const*) {
			ret.push_back(k);
			return false;
		});
		return ret;
	}
	std::shared_ptr<Impl> member(std::string const& key) const {
		auto ret = std::shared_ptr<Impl>();
		auto base = &r->tokens[0];
		auto self = r;
		each_member([&](std::string const& k, Detail::Token const* v) {
			if (k != key)
				return false;
			ret = std::make_shared<Impl>(self, std::size_t(v - base));
			return true;
		});
		return ret;
	}
	std::shared_ptr<Impl> element(std::size_t n) const {
		auto& t = token();
		if (t.type != Detail::Array)
			throw TypeError();
		if (n >= std::size_t(t.size))
			return nullptr;
		auto p = &t + 1;
		for (auto k = std::size_t(0); k < n; ++k)
			Detail::Token::next(p);
		return std::make_shared<Impl>(r, std::size_t(p - &r->tokens[0]));
	}

	Detail::Iterator begin() const {
		return Detail::Iterator(r, i + 1);
	}
	Detail::Iterator end() const {
		auto p = &token();
		Detail::Token::next(p);
		return Detail::Iterator(r, std::size_t(p - &r->tokens[0]));
	}
};

Object::Object() { }
Object::Object(std::shared_ptr<Detail::ParseResult> r, std::size_t i)
	: pimpl(std::make_shared<Impl>(std::move(r), i)) { }

Object Object::parse_json(char const* text) {
	Jsmn::Parser parser;
	/* Trailing space terminates a bare primitive.  */
	auto results = parser.feed(std::string(text) + " ");
	if (results.size() != 1 || !parser.empty())
		throw ParseError(text, 0);
	return results[0];
}

bool Object::is_null() const {
	return !pimpl
	    || ( pimpl->token().type == Detail::Primitive
	      && pimpl->lead() == 'n'
	       );
}
bool Object::is_boolean() const {
	if (!pimpl || pimpl->token().type != Detail::Primitive)
		return false;
	auto c = pimpl->lead();
	return c == 't' || c == 'f';
}
bool Object::is_string() const {
	return pimpl && pimpl->token().type == Detail::String;
}
bool Object::is_object() const {
	return pimpl && pimpl->token().type == Detail::Object;
}
bool Object::is_array() const {
	return pimpl && pimpl->token().type == Detail::Array;
}
bool Object::is_number() const {
	return pimpl
	    && pimpl->token().type == Detail::Primitive
	    && !is_null() && !is_boolean()
	     ;
}

Object::operator bool() const {
	if (is_null())
		return false;
	if (!is_boolean())
		throw TypeError();
	return pimpl->lead() == 't';
}
Object::operator std::string() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->string();
}
Object::operator double() const {
	if (!is_number())
		throw TypeError();
	return Detail::Str::to_double(pimpl->text());
}

std::size_t Object::size() const {
	if (!is_object() && !is_array())
		throw TypeError();
	return std::size_t(pimpl->token().size);
}
std::vector<std::string> Object::keys() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->keys();
}
bool Object::has(std::string const& key) const {
	if (!pimpl)
		throw TypeError();
	return !!pimpl->member(key);
}
Object Object::operator[](std::string const& key) const {
	if (!pimpl)
		throw TypeError();
	auto ret = Object();
	ret.pimpl = pimpl->member(key);
	return ret;
}
Object Object::operator[](std::size_t n) const {
	if (!pimpl)
		throw TypeError();
	auto ret = Object();
	ret.pimpl = pimpl->element(n);
	return ret;
}

std::string Object::direct_text() const {
	if (!pimpl)
		return "null";
	if (is_string())
		return "\"" + pimpl->text() + "\"";
	return pimpl->text();
}

Detail::Iterator Object::begin() const {
	if (!is_array())
		throw TypeError();
	return pimpl->begin();
}
Detail::Iterator Object::end() const {
	if (!is_array())
		throw TypeError();
	return pimpl->end();
}

std::ostream& operator<<(std::ostream& os, Jsmn::Object const& o) {
	if (o.is_object()) {
		os << "{";
		auto first = true;
		for (auto const& k : o.keys()) {
			if (!first)
				os << ",";
			first = false;
			os << "\"" << Detail::Str::to_escaped(k) << "\":" << o[k];
		}
		return os << "}";
	}
	if (o.is_array()) {
		os << "[";
		auto first = true;
		for (auto e : o) {
			if (!first)
				os << ",";
			first = false;
			os << e;
		}
		return os << "]";
	}
	return os << o.direct_text();
}

}
