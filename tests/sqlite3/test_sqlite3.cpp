#undef NDEBUG
#include"Sqlite3.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<cstdint>
#include<memory>
#include<stdexcept>

int main() {
	auto db = Sqlite3::Db(":memory:");
	auto order = std::string();

	auto append = [&](std::string what) {
		return db.transact().then([&, what](Sqlite3::Tx tx) {
			order += what;
			auto ptx = std::make_shared<Sqlite3::Tx>(std::move(tx));
			return Ev::yield().then([&, what, ptx]() {
				/* Still ours while we wait.  */
				order += what;
				ptx->commit();
				return Ev::lift();
			});
		});
	};

	auto code = Ev::lift().then([&]() {
		assert(db);
		assert(!Sqlite3::Db());

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.commit();
		assert(!tx);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.rollback();
		assert(!tx);

		/* Transactions are handed out one at a time.  */
		return Ev::concurrent(append("a"))
		     + Ev::concurrent(append("b"))
		     + Ev::yield(10);
	}).then([&]() {
		assert(order == "aabb");

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query_execute(R"QRY(
		CREATE TABLE "parent" (id TEXT PRIMARY KEY);
		CREATE TABLE "child"
		     ( parent TEXT REFERENCES "parent"(id)
		     , n INTEGER
		     , x REAL
		     , t TEXT
		     );
		)QRY");
		tx.query("INSERT INTO \"parent\" VALUES(:id);")
			.bind(":id", "p1")
			.execute();
		tx.query("INSERT INTO \"child\" VALUES(:p, :n, :x, :t);")
			.bind(":p", std::string("p1"))
			.bind(":n", std::uint64_t(9000000000ULL))
			.bind(":x", 0.5)
			.bind(":t", nullptr)
			.execute();
		tx.commit();

		/* Dropping a transaction without commit rolls
		 * it back.  */
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query_execute("DELETE FROM \"child\";");
		return Ev::lift();
	}).then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto res = tx.query("SELECT parent, n, x FROM \"child\";")
			.execute();
		auto count = 0;
		for (auto& r : res) {
			++count;
			assert(r.get<std::string>(0) == "p1");
			assert(r.get<std::uint64_t>(1) == 9000000000ULL);
			assert(r.get<double>(2) == 0.5);
		}
		assert(count == 1);

		/* Foreign keys are enforced.  */
		auto failed = false;
		try {
			tx.query("INSERT INTO \"child\" VALUES(:p, 1, 1, '');")
				.bind(":p", "nonexistent")
				.execute();
		} catch (std::runtime_error const&) {
			failed = true;
		}
		assert(failed);

		/* Bad SQL throws.  */
		failed = false;
		try {
			tx.query_execute("NOT SQL AT ALL;");
		} catch (std::runtime_error const&) {
			failed = true;
		}
		assert(failed);
		tx.commit();

		return Ev::lift(0);
	});

	return Ev::start(code);
}
