#ifndef JSMN_DETAIL_TOKEN_HPP
#define JSMN_DETAIL_TOKEN_HPP

#include"Jsmn/Detail/Type.hpp"

namespace Jsmn { namespace Detail {

struct Token {
	Type type;
	int start;
	int end;
	/* Children: elements for arrays, keys for
	 * objects, 1 for a key (its value).  */
	int size;

	/* Moves the pointer past the token and every
	 * token nested inside it.  */
	static void next(Token const*& tokptr);
};

}}

#endif /* !defined(JSMN_DETAIL_TOKEN_HPP) */
