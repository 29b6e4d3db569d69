#ifndef SQLITE3_DB_HPP
#define SQLITE3_DB_HPP

#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Sqlite3 { class Query; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Db
 *
 * @brief shared handle to an SQLITE3 database.
 *
 * @desc Copies refer to the same connection.
 * All access goes through `transact`, which
 * hands out at most one `Sqlite3::Tx` at a time;
 * other greenthreads asking for a transaction
 * wait in line until the current one ends.
 */
class Db {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	friend class Sqlite3::Query;
	friend class Sqlite3::Result;
	friend class Sqlite3::Tx;

	void* connection() const;
	void release();

public:
	/* ":memory:" gives a private in-memory database.  */
	explicit
	Db(std::string const& filename);

	Db() =default;
	Db(Db const&) =default;
	Db(Db&&) =default;
	Db& operator=(Db const&) =default;
	Db& operator=(Db&&) =default;

	explicit operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	/** Sqlite3::Db::transact
	 *
	 * @brief begins a transaction once no other
	 * transaction is outstanding on this database.
	 */
	Ev::Io<Sqlite3::Tx> transact();
};

}

#endif /* !defined(SQLITE3_DB_HPP) */
