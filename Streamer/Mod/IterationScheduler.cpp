#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Streamer/Mod/IterationScheduler.hpp"
#include"Streamer/Mod/StreamController.hpp"
#include"Streamer/Msg/StreamPartPaid.hpp"
#include"Streamer/Msg/StreamProgress.hpp"
#include"Streamer/PaymentClient.hpp"
#include"Streamer/StreamError.hpp"
#include"Streamer/StreamRegistry.hpp"
#include"Streamer/StreamStore.hpp"
#include"Streamer/concurrent.hpp"
#include"Streamer/log.hpp"

namespace {

/* Outcome of a remote call that may fail with
 * Streamer::PaymentClientError.  */
struct Attempt {
	bool ok;
	std::string value;
	std::string error;
};

Ev::Io<Attempt> attempt(Ev::Io<std::string> act) {
	return act.then([](std::string value) {
		return Ev::lift(Attempt{true, std::move(value), ""});
	}).catching<Streamer::PaymentClientError>([](Streamer::PaymentClientError const& e) {
		return Ev::lift(Attempt{false, "", e.what()});
	});
}

}

namespace Streamer { namespace Mod {

IterationScheduler::IterationScheduler( S::Bus& bus_
				      , StreamController& controller_
				      ) : bus(bus_), controller(controller_) { }

void IterationScheduler::schedule(std::string const& id) {
	auto entry = controller.registry().get(id);
	if (!entry)
		return;
	auto delay = entry->payment.delay;
	/* A zero repeat would make the timer one-shot.  */
	if (delay == 0)
		delay = 1;
	entry->timers.start_interval(double(delay) / 1000.0, [this, id]() {
		return Streamer::concurrent(tick(id));
	});
}

Ev::Io<void> IterationScheduler::tick(std::string const& id) {
	return Ev::lift().then([this, id]() -> Ev::Io<void> {
		auto entry = controller.registry().get(id);
		if (!entry)
			return controller.handle_error(
				id, StreamError(Error_NotInStore)
			);
		auto& p = entry->payment;
		if (p.status != Status_Streaming)
			return Ev::lift();
		/* One invoice at a time; a slow remote must
		 * not have us fetch another for the same
		 * part.  */
		if (entry->invoice_pending)
			return Ev::lift();

		if (p.parts_paid + p.parts_requested >= p.total_parts) {
			if (p.parts_requested == 0)
				return controller.finish(id);
			/* Let the part in flight land.  */
			return Ev::lift();
		}

		auto client = controller.client();
		if (!client)
			return controller.handle_error(
				id, StreamError(Error_NoBackendConnection)
			);

		auto epoch = entry->epoch;
		entry->invoice_pending = true;
		auto watchdog = entry->timers.arm_watchdog(
			controller.error_timeout(),
			[this, id, epoch]() -> Ev::Io<void> {
				auto e = controller.registry().get(id);
				if (!e || e->epoch != epoch)
					return Ev::lift();
				return controller.handle_error(
					id, StreamError(Error_RemoteNotResponding)
				);
			}
		);

		return attempt(client->create_invoice( p.counterparty
						     , p.price
						     , p.memo
						     ))
		     .then([this, id, epoch, watchdog](Attempt r) -> Ev::Io<void> {
			auto e = controller.registry().get(id);
			if (!e || e->epoch != epoch)
				return Streamer::log( bus, Debug
						    , "Stream %s: invoice request "
						      "resolved after stream "
						      "stopped, ignoring."
						    , id.c_str()
						    );
			e->invoice_pending = false;
			if (!r.ok) {
				e->timers.cancel_watchdog(watchdog);
				if (is_remote_offline(r.error))
					return controller.handle_error(
						id,
						StreamError(Error_RemoteOffline)
					);
				return controller.handle_error(
					id, StreamError(Error_Remote, r.error)
				);
			}
			++e->payment.parts_requested;
			return pay(id, epoch, watchdog, r.value);
		});
	});
}

Ev::Io<void> IterationScheduler::pay( std::string const& id
				    , std::uint64_t epoch
				    , std::uint64_t watchdog
				    , std::string const& invoice
				    ) {
	auto client = controller.client();
	if (!client)
		return controller.handle_error(
			id, StreamError(Error_NoBackendConnection)
		);
	return attempt(client->pay_invoice(invoice))
	     .then([this, id, epoch, watchdog](Attempt r) -> Ev::Io<void> {
		auto e = controller.registry().get(id);
		if (!e || e->epoch != epoch) {
			if (!r.ok)
				return Ev::lift();
			return Streamer::log( bus, Warn
					    , "Stream %s: payment %s succeeded "
					      "after stream stopped; not "
					      "counted."
					    , id.c_str(), r.value.c_str()
					    );
		}
		e->timers.cancel_watchdog(watchdog);
		auto& p = e->payment;
		if (p.parts_requested > 0)
			--p.parts_requested;
		if (!r.ok)
			return controller.handle_error(
				id, StreamError(Error_Remote, r.error)
			);

		++p.parts_paid;
		auto progress = Msg::StreamProgress{
			id, p.parts_paid, p.total_parts
		};
		auto paid = Msg::StreamPartPaid{id, r.value, p.price};
		auto status = p.status;

		auto act = Ev::lift();
		auto store = controller.store();
		if (store) {
			act += store->update_stream_progress( id
							    , progress.parts_paid
							    , status
							    );
			act += store->insert_part(r.value, id);
		}
		return act.then([this, progress]() {
			return bus.raise(progress);
		}).then([this, paid]() {
			return Streamer::concurrent(bus.raise(paid));
		});
	});
}

}}
