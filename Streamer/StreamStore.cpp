#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Streamer/StreamStore.hpp"
#include"Streamer/log.hpp"

namespace Streamer {

StreamStore::StreamStore(S::Bus& bus_, Sqlite3::Db db_)
	: bus(bus_), db(std::move(db_)) { }

Ev::Io<void> StreamStore::best_effort(char const* what, Ev::Io<void> act) {
	return act.catching<std::exception>([this, what](std::exception const& e) {
		return Streamer::log( bus, Warn
				    , "StreamStore: %s failed: %s"
				    , what, e.what()
				    );
	});
}

Ev::Io<void> StreamStore::init() {
	return db.transact().then([](Sqlite3::Tx tx) {
		tx.query_execute(R"QRY(
		CREATE TABLE IF NOT EXISTS "StreamPayments"
		     ( id TEXT PRIMARY KEY
		     , counterparty TEXT NOT NULL
		     , price INTEGER NOT NULL
		     , delay INTEGER NOT NULL
		     , total_parts INTEGER NOT NULL
		     , parts_paid INTEGER NOT NULL
		     , fee INTEGER NOT NULL
		     , memo TEXT NOT NULL
		     , name TEXT NOT NULL
		     , created_at REAL NOT NULL
		     , status TEXT NOT NULL
		     );
		CREATE INDEX IF NOT EXISTS "StreamPayments_created_at"
		    ON "StreamPayments"(created_at);
		CREATE TABLE IF NOT EXISTS "StreamParts"
		     ( payment_hash TEXT PRIMARY KEY
		     , stream_id TEXT NOT NULL
		                 REFERENCES "StreamPayments"(id)
		     );
		CREATE INDEX IF NOT EXISTS "StreamParts_stream_id"
		    ON "StreamParts"(stream_id);
		)QRY");
		tx.commit();
		return Ev::lift();
	});
}

Ev::Io<void> StreamStore::insert_stream(StreamPayment const& p) {
	auto copy = p;
	return best_effort("insert_stream", db.transact().then([copy](Sqlite3::Tx tx) {
		tx.query(R"QRY(
		INSERT OR REPLACE INTO "StreamPayments"
		VALUES( :id, :counterparty, :price, :delay
		      , :total_parts, :parts_paid, :fee
		      , :memo, :name, :created_at, :status
		      );
		)QRY")
			.bind(":id", copy.id)
			.bind(":counterparty", copy.counterparty)
			.bind(":price", copy.price.to_msat())
			.bind(":delay", copy.delay)
			.bind(":total_parts", copy.total_parts)
			.bind(":parts_paid", copy.parts_paid)
			.bind(":fee", copy.fee.to_msat())
			.bind(":memo", copy.memo)
			.bind(":name", copy.name)
			.bind(":created_at", copy.created_at)
			.bind(":status", persisted_status(copy.status))
			.execute();
		tx.commit();
		return Ev::lift();
	}));
}

Ev::Io<void>
StreamStore::update_stream_progress( std::string const& id
				   , std::size_t parts_paid
				   , StreamStatus status
				   ) {
	return best_effort("update_stream_progress", db.transact().then([ id
									, parts_paid
									, status
									](Sqlite3::Tx tx) {
		tx.query(R"QRY(
		UPDATE "StreamPayments"
		   SET parts_paid = :parts_paid
		     , status = :status
		 WHERE id = :id;
		)QRY")
			.bind(":parts_paid", parts_paid)
			.bind(":status", persisted_status(status))
			.bind(":id", id)
			.execute();
		tx.commit();
		return Ev::lift();
	}));
}

Ev::Io<void> StreamStore::insert_part( std::string const& payment_hash
				     , std::string const& stream_id
				     ) {
	return best_effort("insert_part", db.transact().then([ payment_hash
							     , stream_id
							     ](Sqlite3::Tx tx) {
		tx.query(R"QRY(
		INSERT INTO "StreamParts" VALUES(:hash, :stream_id);
		)QRY")
			.bind(":hash", payment_hash)
			.bind(":stream_id", stream_id)
			.execute();
		tx.commit();
		return Ev::lift();
	}));
}

Ev::Io<void> StreamStore::reset_running_to_paused() {
	return best_effort("reset_running_to_paused", db.transact().then([](Sqlite3::Tx tx) {
		tx.query_execute(R"QRY(
		UPDATE "StreamPayments"
		   SET status = 'paused'
		 WHERE status = 'running';
		)QRY");
		tx.commit();
		return Ev::lift();
	}));
}

Ev::Io<std::vector<StreamPayment>> StreamStore::list_streams() {
	return db.transact().then([](Sqlite3::Tx tx) {
		auto ret = std::vector<StreamPayment>();
		auto rows = tx.query(R"QRY(
		SELECT id, counterparty, price, delay
		     , total_parts, parts_paid, fee
		     , memo, name, created_at, status
		  FROM "StreamPayments"
		 ORDER BY created_at DESC;
		)QRY").execute();
		for (auto& r : rows) {
			auto p = StreamPayment();
			p.id = r.get<std::string>(0);
			p.counterparty = r.get<std::string>(1);
			p.price = Ln::Amount::msat(r.get<std::uint64_t>(2));
			p.delay = r.get<std::uint64_t>(3);
			p.total_parts = r.get<std::size_t>(4);
			p.parts_paid = r.get<std::size_t>(5);
			p.parts_requested = 0;
			p.fee = Ln::Amount::msat(r.get<std::uint64_t>(6));
			p.memo = r.get<std::string>(7);
			p.name = r.get<std::string>(8);
			p.created_at = r.get<double>(9);
			p.status = status_from_persisted(r.get<std::string>(10));
			ret.push_back(std::move(p));
		}
		tx.commit();
		return Ev::lift(std::move(ret));
	});
}

Ev::Io<std::size_t> StreamStore::count_parts(std::string const& stream_id) {
	return db.transact().then([stream_id](Sqlite3::Tx tx) {
		auto rows = tx.query(R"QRY(
		SELECT COUNT(*) FROM "StreamParts" WHERE stream_id = :stream_id;
		)QRY")
			.bind(":stream_id", stream_id)
			.execute();
		auto count = std::size_t(0);
		for (auto& r : rows)
			count = r.get<std::size_t>(0);
		tx.commit();
		return Ev::lift(count);
	});
}

}
