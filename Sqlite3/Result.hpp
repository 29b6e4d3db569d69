#ifndef SQLITE3_RESULT_HPP
#define SQLITE3_RESULT_HPP

#include"Sqlite3/Db.hpp"
#include"Sqlite3/Detail/columns.hpp"
#include<iterator>

namespace Sqlite3 { class Query; }

namespace Sqlite3 {

class Result;

/** class Sqlite3::Row
 *
 * @brief the row a `Result::iterator` currently
 * points at.
 * Columns are indexed from 0.
 */
class Row {
private:
	Result* r;

	friend class Sqlite3::Result;
	explicit
	Row(Result* r_) : r(r_) { }

public:
	template<typename a>
	a get(int col) const;
};

/** class Sqlite3::Result
 *
 * @brief rows produced by an executed query.
 *
 * @desc Single-pass: iterate it at most once.
 * Statements that produce no rows have already
 * run to completion when the Result is built.
 */
class Result {
private:
	Sqlite3::Db db;
	void* stmt;

	friend class Sqlite3::Query;
	friend class Sqlite3::Row;

	Result(Sqlite3::Db const& db_, void* stmt_);

	/* false once there are no more rows.  */
	bool step();

public:
	Result(Result const&) =delete;
	Result(Result&&);
	~Result();

	class iterator {
	private:
		Row row;

		friend class Sqlite3::Result;
		explicit
		iterator(Result* r) : row(r) { }

	public:
		typedef std::input_iterator_tag iterator_category;
		typedef Row value_type;
		typedef std::ptrdiff_t difference_type;
		typedef Row const* pointer;
		typedef Row const& reference;

		iterator() : row(nullptr) { }

		bool operator==(iterator const& o) const {
			return row.r == o.row.r;
		}
		bool operator!=(iterator const& o) const {
			return !(*this == o);
		}
		iterator& operator++() {
			if (row.r && !row.r->step())
				row.r = nullptr;
			return *this;
		}
		Row const& operator*() const { return row; }
		Row const* operator->() const { return &row; }
	};

	iterator begin() {
		return iterator(stmt ? this : nullptr);
	}
	iterator end() {
		return iterator();
	}
};

template<typename a>
a Row::get(int col) const {
	return Detail::Column<a>::column(r->stmt, col);
}

}

#endif /* !defined(SQLITE3_RESULT_HPP) */
