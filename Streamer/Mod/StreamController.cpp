#include"Ev/Io.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ln/Amount.hpp"
#include"S/Bus.hpp"
#include"Streamer/Mod/IterationScheduler.hpp"
#include"Streamer/Mod/StreamController.hpp"
#include"Streamer/Msg/DbResource.hpp"
#include"Streamer/Msg/ManifestOption.hpp"
#include"Streamer/Msg/Manifestation.hpp"
#include"Streamer/Msg/Option.hpp"
#include"Streamer/Msg/PaymentBackend.hpp"
#include"Streamer/Msg/StreamError.hpp"
#include"Streamer/PaymentClient.hpp"
#include"Streamer/Shutdown.hpp"
#include"Streamer/StreamError.hpp"
#include"Streamer/StreamPayment.hpp"
#include"Streamer/StreamRegistry.hpp"
#include"Streamer/StreamStore.hpp"
#include"Streamer/log.hpp"
#include"Util/make_unique.hpp"
#include"Uuid.hpp"
#include<cstdlib>

namespace Streamer { namespace Mod {

class StreamController::Impl {
private:
	S::Bus& bus;
	std::function<double()> get_now;
	double timeout;

	PaymentClient* payment_client;
	std::unique_ptr<StreamStore> db_store;
	StreamRegistry streams;
	IterationScheduler scheduler;
	std::unique_ptr<StreamPayment> active_draft;

	void start() {
		bus.subscribe<Msg::DbResource
			     >([this](Msg::DbResource const& m) {
			db_store = Util::make_unique<StreamStore>(bus, m.db);
			return db_store->init().then([this]() {
				return db_store->reset_running_to_paused();
			}).then([this]() {
				return streams.load(*db_store);
			}).then([this]() {
				return Streamer::log( bus, Info
						    , "StreamController: "
						      "%zu stream payments "
						      "loaded."
						    , streams.size()
						    );
			});
		});
		bus.subscribe<Msg::PaymentBackend
			     >([this](Msg::PaymentBackend const& m) {
			payment_client = &m.client;
			return Ev::lift();
		});
		bus.subscribe<Msg::Manifestation
			     >([this](Msg::Manifestation const&) {
			return bus.raise(Msg::ManifestOption{
				"streamer-error-timeout",
				Msg::OptionType_Int,
				Json::Out::direct(int(timeout)),
				"Seconds to wait for the counterparty "
				"and the payment of a stream part "
				"before pausing the stream."
			});
		});
		bus.subscribe<Msg::Option
			     >([this](Msg::Option const& o) -> Ev::Io<void> {
			if (o.name != "streamer-error-timeout")
				return Ev::lift();
			auto value = 0.0;
			if (o.value.is_number())
				value = double(o.value);
			else if (o.value.is_string())
				value = std::strtod( std::string(o.value).c_str()
						   , nullptr
						   );
			if (value <= 0)
				return Streamer::log( bus, Warn
						    , "StreamController: "
						      "ignoring invalid "
						      "streamer-error-timeout "
						      "%s"
						    , o.value.direct_text()
							     .c_str()
						    );
			timeout = value;
			return Streamer::log( bus, Debug
					    , "StreamController: error "
					      "timeout %g seconds."
					    , timeout
					    );
		});
		bus.subscribe<Streamer::Shutdown
			     >([this](Streamer::Shutdown const&) {
			streams.cancel_all_timers();
			return Ev::lift();
		});
	}

	/* Stops the timers of a stream and moves it to
	 * `status`, so that anything in flight for it is
	 * ignored when it returns.  */
	void halt(StreamRegistry::Entry& e, StreamStatus status) {
		e.timers.cancel_all();
		++e.epoch;
		e.invoice_pending = false;
		e.payment.parts_requested = 0;
		e.payment.status = status;
	}

	/* Pauses every Streaming stream in memory and
	 * returns their ids.  */
	std::vector<std::string> halt_all() {
		auto ids = streams.streaming();
		for (auto const& id : ids)
			halt(*streams.get(id), Status_Paused);
		return ids;
	}

	Ev::Io<void> persist(std::string const& id) {
		auto e = streams.get(id);
		if (!e || !db_store)
			return Ev::lift();
		return db_store->update_stream_progress( id
						       , e->payment.parts_paid
						       , e->payment.status
						       );
	}
	Ev::Io<void> persist(std::vector<std::string> const& ids) {
		auto act = Ev::lift();
		for (auto const& id : ids)
			act += persist(id);
		return act;
	}

public:
	Impl( S::Bus& bus_
	    , std::function<double()> get_now_
	    , double timeout_
	    , StreamController& self
	    ) : bus(bus_)
	      , get_now(std::move(get_now_))
	      , timeout(timeout_)
	      , payment_client(nullptr)
	      , scheduler(bus_, self)
	      {
		start();
	}

	Ev::Io<StreamPayment> prepare( std::string const& counterparty
				     , Ln::Amount price
				     , std::uint64_t delay
				     , std::size_t total_parts
				     , std::string const& name
				     ) {
		if (!payment_client)
			return Ev::lift().then([]() -> Ev::Io<StreamPayment> {
				throw StreamError(Error_NoBackendConnection);
			});

		auto draft = StreamPayment();
		draft.id = std::string(Uuid::random());
		draft.counterparty = counterparty;
		draft.price = price;
		draft.delay = delay;
		draft.total_parts = total_parts;
		draft.parts_paid = 0;
		draft.parts_requested = 0;
		draft.memo = "stream_payment_" + draft.id;
		draft.name = name.empty() ? "Stream payment" : name;
		draft.created_at = get_now();
		draft.status = Status_Prepared;

		return payment_client->quote_fee(counterparty, price)
		     .then([this, draft](Ln::Amount fee) {
			auto ret = draft;
			ret.fee = fee;
			active_draft = Util::make_unique<StreamPayment>(ret);
			return Ev::lift(std::move(ret));
		}).catching<PaymentClientError>([](PaymentClientError const& e) -> Ev::Io<StreamPayment> {
			throw StreamError(Error_FeeQuote, e.what());
		}).catching<Jsmn::TypeError>([](Jsmn::TypeError const& e) -> Ev::Io<StreamPayment> {
			throw StreamError(Error_FeeQuote, e.what());
		});
	}

	Ev::Io<void> clear() {
		active_draft = nullptr;
		return Ev::lift();
	}

	Ev::Io<StreamPayment> commit() {
		if (!active_draft)
			return Ev::lift().then([]() -> Ev::Io<StreamPayment> {
				throw StreamError(Error_MissingDraft);
			});
		auto p = *active_draft;
		active_draft = nullptr;
		p.status = Status_Paused;
		streams.upsert(p);

		auto act = Ev::lift();
		if (db_store)
			act = db_store->insert_stream(p);
		return act.then([this, p]() {
			return Streamer::log( bus, Info
					    , "Stream %s committed: %zu parts "
					      "of %s to %s."
					    , p.id.c_str()
					    , p.total_parts
					    , std::string(p.price).c_str()
					    , p.counterparty.c_str()
					    );
		}).then([p]() {
			return Ev::lift(p);
		});
	}

	Ev::Io<void> pause(std::string const& id) {
		auto e = streams.get(id);
		if (!e || e->payment.status == Status_Finished)
			return Ev::lift();
		halt(*e, Status_Paused);
		return persist(id);
	}

	Ev::Io<void> pause_all() {
		return persist(halt_all());
	}

	Ev::Io<void> start(std::string const& id) {
		auto e = streams.get(id);
		if (!e || e->payment.status == Status_Finished)
			return Ev::lift();
		auto paused = halt_all();
		++e->epoch;
		e->invoice_pending = false;
		e->payment.parts_requested = 0;
		e->payment.status = Status_Streaming;
		scheduler.schedule(id);
		return persist(paused) + persist(id)
		     + Streamer::log( bus, Info
				    , "Stream %s started, %zu of %zu parts "
				      "paid."
				    , id.c_str()
				    , e->payment.parts_paid
				    , e->payment.total_parts
				    );
	}

	Ev::Io<void> finish(std::string const& id) {
		auto e = streams.get(id);
		if (!e || e->payment.status == Status_Finished)
			return Ev::lift();
		auto paused = halt_all();
		halt(*e, Status_Finished);
		return persist(paused) + persist(id)
		     + Streamer::log( bus, Info
				    , "Stream %s finished, %zu of %zu parts "
				      "paid."
				    , id.c_str()
				    , e->payment.parts_paid
				    , e->payment.total_parts
				    );
	}

	Ev::Io<void> handle_error( std::string const& id
				 , StreamError const& err
				 ) {
		auto msg = Msg::StreamError{
			"stream_error", id,
			error_code_name(err.code), err.what()
		};
		auto act = Streamer::log( bus, Warn
					, "Stream %s: %s: %s"
					, id.c_str()
					, msg.error.c_str()
					, msg.message.c_str()
					);
		act += pause(id);
		act += bus.raise(std::move(msg));
		return act;
	}

	std::vector<StreamPayment> list() const {
		return streams.all();
	}
	std::unique_ptr<StreamPayment> draft() const {
		if (!active_draft)
			return nullptr;
		return Util::make_unique<StreamPayment>(*active_draft);
	}

	StreamRegistry& registry() { return streams; }
	PaymentClient* client() const { return payment_client; }
	StreamStore* store() const { return db_store.get(); }
	double error_timeout() const { return timeout; }
};

StreamController::StreamController( S::Bus& bus
				  , std::function<double()> get_now
				  , double error_timeout
				  ) : pimpl(Util::make_unique<Impl>( bus
								   , std::move(get_now)
								   , error_timeout
								   , *this
								   )) { }
StreamController::~StreamController() { }

Ev::Io<StreamPayment>
StreamController::prepare( std::string const& counterparty
			 , Ln::Amount price
			 , std::uint64_t delay
			 , std::size_t total_parts
			 , std::string const& name
			 ) {
	return pimpl->prepare(counterparty, price, delay, total_parts, name);
}
Ev::Io<void> StreamController::clear() {
	return pimpl->clear();
}
Ev::Io<StreamPayment> StreamController::commit() {
	return pimpl->commit();
}
Ev::Io<void> StreamController::pause(std::string const& id) {
	return pimpl->pause(id);
}
Ev::Io<void> StreamController::pause_all() {
	return pimpl->pause_all();
}
Ev::Io<void> StreamController::start(std::string const& id) {
	return pimpl->start(id);
}
Ev::Io<void> StreamController::finish(std::string const& id) {
	return pimpl->finish(id);
}
Ev::Io<void> StreamController::handle_error( std::string const& id
					   , StreamError const& err
					   ) {
	return pimpl->handle_error(id, err);
}
std::vector<StreamPayment> StreamController::list() const {
	return pimpl->list();
}
std::unique_ptr<StreamPayment> StreamController::draft() const {
	return pimpl->draft();
}
StreamRegistry& StreamController::registry() {
	return pimpl->registry();
}
PaymentClient* StreamController::client() const {
	return pimpl->client();
}
StreamStore* StreamController::store() const {
	return pimpl->store();
}
double StreamController::error_timeout() const {
	return pimpl->error_timeout();
}

}}
