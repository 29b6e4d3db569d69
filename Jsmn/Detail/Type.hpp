#ifndef JSMN_DETAIL_TYPE_HPP
#define JSMN_DETAIL_TYPE_HPP

namespace Jsmn { namespace Detail {

/* Mirrors jsmntype_t without exposing jsmn.h.  */
enum Type {
	Undefined = 0,
	Object = 1,
	Array = 2,
	String = 3,
	Primitive = 4
};

}}

#endif /* !defined(JSMN_DETAIL_TYPE_HPP) */
