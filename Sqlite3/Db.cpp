#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/BacktraceException.hpp"
#include<deque>
#include<sqlite3.h>
#include<stdexcept>

namespace {

std::runtime_error open_failure(char const* step, sqlite3* conn) {
	auto msg = conn ? std::string(sqlite3_errmsg(conn))
			: std::string("out of memory")
			;
	return Util::BacktraceException<std::runtime_error>(
		std::string("Sqlite3::Db: ") + step + ": " + msg
	);
}

}

namespace Sqlite3 {

class Db::Impl {
private:
	sqlite3* conn;
	bool busy;
	std::deque<std::function<void()>> waiting;

public:
	explicit
	Impl(std::string const& filename) : conn(nullptr), busy(false) {
		if (sqlite3_open(filename.c_str(), &conn) != SQLITE_OK) {
			auto err = open_failure("sqlite3_open", conn);
			sqlite3_close_v2(conn);
			throw err;
		}
		if (sqlite3_extended_result_codes(conn, 1) != SQLITE_OK) {
			auto err = open_failure("extended_result_codes", conn);
			sqlite3_close_v2(conn);
			throw err;
		}
		auto res = sqlite3_exec( conn, "PRAGMA foreign_keys = ON;"
				       , nullptr, nullptr, nullptr
				       );
		if (res != SQLITE_OK) {
			auto err = open_failure("foreign_keys", conn);
			sqlite3_close_v2(conn);
			throw err;
		}
	}
	Impl(Impl const&) =delete;
	~Impl() {
		sqlite3_close_v2(conn);
	}

	sqlite3* connection() const { return conn; }

	/* Wait our turn.  */
	Ev::Io<void> acquire() {
		return Ev::Io<void>([this]( std::function<void()> pass
					  , std::function<void(std::exception_ptr)>
					  ) {
			if (busy) {
				waiting.push_back(std::move(pass));
				return;
			}
			busy = true;
			pass();
		});
	}
	void release() {
		if (waiting.empty()) {
			busy = false;
			return;
		}
		auto next = std::move(waiting.front());
		waiting.pop_front();
		next();
	}
};

Db::Db(std::string const& filename)
	: pimpl(std::make_shared<Impl>(filename)) { }

void* Db::connection() const {
	return pimpl->connection();
}
void Db::release() {
	pimpl->release();
}

Ev::Io<Sqlite3::Tx> Db::transact() {
	auto self = *this;
	return pimpl->acquire().then([]() {
		/* Unwind the stack of whoever released us.  */
		return Ev::yield();
	}).then([self]() {
		auto tx = std::make_shared<Sqlite3::Tx>();
		try {
			*tx = Sqlite3::Tx(self);
		} catch (std::exception const&) {
			self.pimpl->release();
			throw;
		}
		return Ev::Io<Sqlite3::Tx>([tx]( std::function<void(Sqlite3::Tx)> pass
					       , std::function<void(std::exception_ptr)>
					       ) {
			pass(std::move(*tx));
		});
	});
}

}
