#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Streamer/StreamRegistry.hpp"
#include"Streamer/StreamStore.hpp"
#include<assert.h>

namespace {

Streamer::StreamPayment make( std::string id
			    , double created_at
			    , Streamer::StreamStatus status
			    ) {
	auto p = Streamer::StreamPayment();
	p.id = id;
	p.counterparty = "lno1counterparty";
	p.price = Ln::Amount::msat(100);
	p.delay = 1000;
	p.total_parts = 3;
	p.parts_paid = 1;
	p.parts_requested = 0;
	p.fee = Ln::Amount::msat(1);
	p.memo = "stream_payment_" + id;
	p.name = id;
	p.created_at = created_at;
	p.status = status;
	return p;
}

}

int main() {
	auto bus = S::Bus();
	auto store = Streamer::StreamStore(bus, Sqlite3::Db(":memory:"));
	auto registry = Streamer::StreamRegistry();

	auto code = Ev::lift().then([&]() {
		return store.init();
	}).then([&]() {
		return store.insert_stream(make("paused", 100, Streamer::Status_Paused))
		     + store.insert_stream(make("ended", 200, Streamer::Status_Finished))
		     + store.insert_stream(make("running", 300, Streamer::Status_Streaming))
		     ;
	}).then([&]() {
		/* Something left behind by an earlier load.  */
		registry.upsert(make("stale", 50, Streamer::Status_Paused));
		return registry.load(store);
	}).then([&]() {
		/* Finished streams are not loaded.  */
		assert(registry.size() == 2);
		assert(!registry.get("ended"));
		assert(!registry.get("stale"));

		/* Streams that were running come back
		 * paused.  */
		auto running = registry.get("running");
		assert(running);
		assert(running->payment.status == Streamer::Status_Paused);
		assert(running->payment.parts_paid == 1);
		assert(!running->timers.active());
		assert(registry.streaming().empty());

		auto all = registry.all();
		assert(all.size() == 2);
		assert(all[0].id == "running");
		assert(all[1].id == "paused");

		/* New streams go first.  */
		auto& fresh = registry.upsert(make("fresh", 400, Streamer::Status_Paused));
		fresh.epoch = 7;
		all = registry.all();
		assert(all.size() == 3);
		assert(all[0].id == "fresh");

		/* Updating keeps position and epoch.  */
		auto update = make("fresh", 400, Streamer::Status_Streaming);
		update.parts_paid = 2;
		auto& same = registry.upsert(update);
		assert(&same == &fresh);
		assert(same.epoch == 7);
		assert(registry.size() == 3);
		assert(registry.all()[0].parts_paid == 2);
		auto streaming = registry.streaming();
		assert(streaming.size() == 1);
		assert(streaming[0] == "fresh");

		/* Nothing is outstanding on a fresh or
		 * reloaded entry.  */
		assert(!fresh.invoice_pending);
		assert(!running->invoice_pending);
		assert(!registry.get("nosuchstream"));
		auto const& cregistry = registry;
		assert(cregistry.get("paused"));
		assert(cregistry.size() == 3);

		registry.cancel_all_timers();
		return Ev::lift(0);
	});

	return Ev::start(code);
}
