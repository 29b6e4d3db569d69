#include"Sqlite3/Detail/binds.hpp"
#include"Util/BacktraceException.hpp"
#include<sqlite3.h>
#include<stdexcept>

namespace {

void check(int res, char const* what) {
	if (res != SQLITE_OK)
		throw Util::BacktraceException<std::runtime_error>(
			std::string("Sqlite3: ") + what + ": " +
			sqlite3_errstr(res)
		);
}

}

namespace Sqlite3 { namespace Detail {

void bind_double(void* stmt, int loc, double v) {
	check(sqlite3_bind_double((sqlite3_stmt*) stmt, loc, v), "bind_double");
}
void bind_int(void* stmt, int loc, std::int64_t v) {
	check(sqlite3_bind_int64((sqlite3_stmt*) stmt, loc, v), "bind_int64");
}
void bind_text(void* stmt, int loc, std::string const& v) {
	check(sqlite3_bind_text( (sqlite3_stmt*) stmt, loc
			       , v.c_str(), int(v.size())
			       , SQLITE_TRANSIENT
			       ), "bind_text");
}
void bind_null(void* stmt, int loc) {
	check(sqlite3_bind_null((sqlite3_stmt*) stmt, loc), "bind_null");
}

}}
