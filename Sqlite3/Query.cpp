#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Result.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<sqlite3.h>
#include<stdexcept>

namespace Sqlite3 {

class Query::Impl {
public:
	Db db;
	sqlite3_stmt* stmt;

	Impl(Db const& db_, void* stmt_)
		: db(db_), stmt((sqlite3_stmt*) stmt_) { }
	Impl(Impl const&) =delete;
	~Impl() {
		sqlite3_finalize(stmt);
	}
};

Query::Query(Sqlite3::Db const& db, void* stmt)
	: pimpl(Util::make_unique<Impl>(db, stmt)) { }
Query::Query(Query&& o) : pimpl(std::move(o.pimpl)) { }
Query::~Query() { }

void* Query::stmt() const {
	if (!pimpl)
		throw Util::BacktraceException<std::logic_error>(
			"Sqlite3::Query: already executed"
		);
	return pimpl->stmt;
}
int Query::index_of(char const* name) const {
	auto idx = sqlite3_bind_parameter_index((sqlite3_stmt*) stmt(), name);
	if (idx == 0)
		throw Util::BacktraceException<std::runtime_error>(
			std::string("Sqlite3::Query: no parameter ") + name
		);
	return idx;
}

Result Query::execute() {
	auto s = stmt();
	auto db = pimpl->db;
	/* The Result now owns the statement.  */
	pimpl->stmt = nullptr;
	pimpl = nullptr;
	return Result(db, s);
}

}
