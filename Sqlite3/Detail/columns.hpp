#ifndef SQLITE3_DETAIL_COLUMNS_HPP
#define SQLITE3_DETAIL_COLUMNS_HPP

#include<cstdint>
#include<string>
#include<type_traits>

namespace Sqlite3 { namespace Detail {

double column_double(void* stmt, int col);
std::int64_t column_int(void* stmt, int col);
std::string column_text(void* stmt, int col);

template<typename a, typename Enable = void>
struct Column;

template<typename a>
struct Column<a, typename std::enable_if<std::is_integral<a>::value>::type> {
	static a column(void* stmt, int col) {
		return a(column_int(stmt, col));
	}
};
template<>
struct Column<bool> {
	static bool column(void* stmt, int col) {
		return column_int(stmt, col) != 0;
	}
};
template<typename a>
struct Column<a, typename std::enable_if<std::is_floating_point<a>::value>::type> {
	static a column(void* stmt, int col) {
		return a(column_double(stmt, col));
	}
};
template<>
struct Column<std::string> {
	static std::string column(void* stmt, int col) {
		return column_text(stmt, col);
	}
};

}}

#endif /* !defined(SQLITE3_DETAIL_COLUMNS_HPP) */
