#include"Jsmn/Detail/Iterator.hpp"
#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Object.hpp"

namespace Jsmn { namespace Detail {

Iterator& Iterator::operator++() {
	Token const* base = &r->tokens[0];
	auto p = base + i;
	Token::next(p);
	i = std::size_t(p - base);
	return *this;
}

Jsmn::Object Iterator::operator*() const {
	return Jsmn::Object(r, i);
}

}}
