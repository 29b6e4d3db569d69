#ifndef SQLITE3_DETAIL_BINDS_HPP
#define SQLITE3_DETAIL_BINDS_HPP

#include<cstddef>
#include<cstdint>
#include<string>
#include<type_traits>

namespace Sqlite3 { namespace Detail {

void bind_double(void* stmt, int loc, double);
void bind_int(void* stmt, int loc, std::int64_t);
void bind_text(void* stmt, int loc, std::string const&);
void bind_null(void* stmt, int loc);

/* Integers (including bool) bind as INTEGER,
 * floating-point as REAL.  */
template<typename a, typename Enable = void>
struct Bind;

template<typename a>
struct Bind<a, typename std::enable_if<std::is_integral<a>::value>::type> {
	static void bind(void* stmt, int loc, a v) {
		bind_int(stmt, loc, std::int64_t(v));
	}
};
template<typename a>
struct Bind<a, typename std::enable_if<std::is_floating_point<a>::value>::type> {
	static void bind(void* stmt, int loc, a v) {
		bind_double(stmt, loc, double(v));
	}
};
template<>
struct Bind<std::string> {
	static void bind(void* stmt, int loc, std::string const& v) {
		bind_text(stmt, loc, v);
	}
};
template<>
struct Bind<char const*> {
	static void bind(void* stmt, int loc, char const* v) {
		bind_text(stmt, loc, std::string(v));
	}
};
template<>
struct Bind<std::nullptr_t> {
	static void bind(void* stmt, int loc, std::nullptr_t) {
		bind_null(stmt, loc);
	}
};

}}

#endif /* !defined(SQLITE3_DETAIL_BINDS_HPP) */
