#include"Sqlite3/Result.hpp"
#include"Util/BacktraceException.hpp"
#include<sqlite3.h>
#include<stdexcept>

namespace Sqlite3 {

Result::Result(Sqlite3::Db const& db_, void* stmt_)
	: db(db_), stmt(stmt_) {
	step();
}
Result::Result(Result&& o) : db(std::move(o.db)), stmt(o.stmt) {
	o.stmt = nullptr;
}
Result::~Result() {
	sqlite3_finalize((sqlite3_stmt*) stmt);
}

bool Result::step() {
	auto s = (sqlite3_stmt*) stmt;
	switch (sqlite3_step(s)) {
	case SQLITE_ROW:
		return true;
	case SQLITE_DONE:
		sqlite3_finalize(s);
		stmt = nullptr;
		return false;
	default: {
		auto msg = std::string(sqlite3_errmsg((sqlite3*) db.connection()));
		sqlite3_finalize(s);
		stmt = nullptr;
		throw Util::BacktraceException<std::runtime_error>(
			"Sqlite3::Result: " + msg
		);
	}
	}
}

}
