#ifndef SQLITE3_QUERY_HPP
#define SQLITE3_QUERY_HPP

#include"Sqlite3/Detail/binds.hpp"
#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Query
 *
 * @brief a prepared statement waiting for its
 * parameters.
 *
 * @desc Parameters are named in the SQL text as
 * `:name`, and bound with the same name including
 * the colon.
 * Unbound parameters are NULL.
 */
class Query {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Tx;
	Query(Sqlite3::Db const&, void* stmt);

	void* stmt() const;
	int index_of(char const* name) const;

public:
	Query(Query&&);
	~Query();

	template<typename a>
	Query& bind(char const* name, a const& value) {
		Detail::Bind<a>::bind(stmt(), index_of(name), value);
		return *this;
	}
	Query& bind(char const* name, char const* value) {
		Detail::Bind<char const*>::bind(stmt(), index_of(name), value);
		return *this;
	}

	/* Consumes the query.  */
	Result execute();
};

}

#endif /* !defined(SQLITE3_QUERY_HPP) */
