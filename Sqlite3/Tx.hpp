#ifndef SQLITE3_TX_HPP
#define SQLITE3_TX_HPP

#include"Sqlite3/Query.hpp"
#include<memory>
#include<string>

namespace Sqlite3 { class Db; }

namespace Sqlite3 {

/** class Sqlite3::Tx
 *
 * @brief an open transaction on a `Sqlite3::Db`.
 *
 * @desc Move-only.
 * Changes become durable only on `commit()`;
 * a transaction that is destroyed while still
 * valid is rolled back.
 * Either way the database is then handed to the
 * next greenthread waiting in `transact`.
 */
class Tx {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Db;

	explicit
	Tx(Sqlite3::Db const&);

public:
	Tx();
	Tx(Tx&&);
	Tx& operator=(Tx&&);
	~Tx();

	explicit operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Sqlite3::Query query(char const*);
	Sqlite3::Query query(std::string const& q) {
		return query(q.c_str());
	}

	/* Runs statements that take no parameters and
	 * return no rows, such as CREATE TABLE.  */
	void query_execute(char const*);
	void query_execute(std::string const& q) {
		query_execute(q.c_str());
	}

	/* Both leave the transaction invalid,
	 * even if they throw.  */
	void commit();
	void rollback();
};

}

#endif /* !defined(SQLITE3_TX_HPP) */
