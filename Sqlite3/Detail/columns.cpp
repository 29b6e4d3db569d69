#include"Sqlite3/Detail/columns.hpp"
#include<sqlite3.h>

namespace Sqlite3 { namespace Detail {

double column_double(void* stmt, int col) {
	return sqlite3_column_double((sqlite3_stmt*) stmt, col);
}
std::int64_t column_int(void* stmt, int col) {
	return sqlite3_column_int64((sqlite3_stmt*) stmt, col);
}
std::string column_text(void* vstmt, int col) {
	auto stmt = (sqlite3_stmt*) vstmt;
	auto text = (char const*) sqlite3_column_text(stmt, col);
	auto len = sqlite3_column_bytes(stmt, col);
	if (!text)
		return "";
	return std::string(text, std::size_t(len));
}

}}
