#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<sqlite3.h>
#include<stdexcept>

namespace Sqlite3 {

class Tx::Impl {
private:
	Sqlite3::Db db;

	sqlite3* conn() const {
		return (sqlite3*) db.connection();
	}

public:
	explicit
	Impl(Sqlite3::Db const& db_) : db(db_) {
		exec("BEGIN");
	}
	~Impl() {
		db.release();
	}

	Sqlite3::Db const& get_db() const { return db; }

	void exec(char const* sql) {
		auto res = sqlite3_exec(conn(), sql, nullptr, nullptr, nullptr);
		if (res != SQLITE_OK)
			throw Util::BacktraceException<std::runtime_error>(
				std::string("Sqlite3::Tx: ") + sql + ": " +
				sqlite3_errmsg(conn())
			);
	}
	/* Never throws; used on the rollback paths.  */
	void exec_quietly(char const* sql) {
		(void) sqlite3_exec(conn(), sql, nullptr, nullptr, nullptr);
	}

	void* prepare(char const* sql) {
		auto stmt = (sqlite3_stmt*) nullptr;
		auto res = sqlite3_prepare_v2(conn(), sql, -1, &stmt, nullptr);
		if (res != SQLITE_OK)
			throw Util::BacktraceException<std::runtime_error>(
				std::string("Sqlite3::Tx: prepare: ") + sql +
				": " + sqlite3_errmsg(conn())
			);
		return stmt;
	}
};

Tx::Tx(Sqlite3::Db const& db) : pimpl(Util::make_unique<Impl>(db)) { }
Tx::Tx() { }
Tx::Tx(Tx&& o) : pimpl(std::move(o.pimpl)) { }
Tx& Tx::operator=(Tx&& o) {
	if (pimpl)
		rollback();
	pimpl = std::move(o.pimpl);
	return *this;
}
Tx::~Tx() {
	if (pimpl)
		pimpl->exec_quietly("ROLLBACK");
}

void Tx::commit() {
	auto my = std::move(pimpl);
	try {
		my->exec("COMMIT");
	} catch (std::exception const&) {
		my->exec_quietly("ROLLBACK");
		throw;
	}
}
void Tx::rollback() {
	auto my = std::move(pimpl);
	my->exec_quietly("ROLLBACK");
}

Query Tx::query(char const* sql) {
	return Query(pimpl->get_db(), pimpl->prepare(sql));
}
void Tx::query_execute(char const* sql) {
	pimpl->exec(sql);
}

}
