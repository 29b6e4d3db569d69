#include"Ev/Io.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ln/Amount.hpp"
#include"S/Bus.hpp"
#include"Streamer/Mod/Rpc.hpp"
#include"Streamer/Mod/RpcPaymentClient.hpp"
#include"Streamer/Msg/Init.hpp"
#include"Streamer/Msg/PaymentBackend.hpp"
#include"Streamer/StreamError.hpp"
#include"Streamer/log.hpp"
#include<exception>
#include<string>

namespace {

/* Runs an RPC command, turning lightningd errors,
 * malformed results and a broken connection into
 * Streamer::PaymentClientError.
 * Streamer::Shutdown passes through.  */
template<typename a>
Ev::Io<a> remote( Ev::Io<Jsmn::Object> call
		, std::function<a(Jsmn::Object)> extract
		) {
	return call.template catching<std::exception
				     >([](std::exception const& e) -> Ev::Io<Jsmn::Object> {
		auto rpc_error = dynamic_cast<Streamer::Mod::RpcError const*>(&e);
		if (rpc_error)
			throw Streamer::PaymentClientError(rpc_error->message());
		/* The socket to lightningd failed; the remote
		 * is as good as unreachable.  */
		throw Streamer::PaymentClientError(
			std::string("Could not route or connect: ") + e.what()
		);
	}).then([extract](Jsmn::Object res) {
		return Ev::lift(extract(std::move(res)));
	}).template catching<Jsmn::TypeError
			    >([](Jsmn::TypeError const& e) -> Ev::Io<a> {
		throw Streamer::PaymentClientError(
			std::string("Unexpected response: ") + e.what()
		);
	});
}

std::string string_field(Jsmn::Object const& res, char const* key) {
	auto js = res[key];
	if (!js.is_string())
		throw Jsmn::TypeError();
	return std::string(js);
}

}

namespace Streamer { namespace Mod {

void RpcPaymentClient::start() {
	bus.subscribe<Msg::Init
		     >([this](Msg::Init const& init) {
		rpc = &init.rpc;
		return bus.raise(Msg::PaymentBackend{*this});
	});
}

Ev::Io<Ln::Amount>
RpcPaymentClient::quote_fee( std::string const& counterparty
			   , Ln::Amount amount
			   ) {
	auto offer = counterparty;
	auto parms = Json::Out()
		.start_object()
			.field("string", offer)
		.end_object()
		;
	return remote<std::string>( rpc->command("decode", std::move(parms))
				  , [](Jsmn::Object res) {
		if (res.has("offer_issuer_id"))
			return string_field(res, "offer_issuer_id");
		return string_field(res, "offer_node_id");
	}).then([this, amount](std::string node) {
		auto parms = Json::Out()
			.start_object()
				.field("id", node)
				.field("amount_msat", amount.to_msat())
				.field("riskfactor", 10)
			.end_object()
			;
		return remote<Ln::Amount>( rpc->command( "getroute"
						       , std::move(parms)
						       )
					 , [amount](Jsmn::Object res) {
			auto route = res["route"];
			if (!route.is_array() || route.size() == 0)
				throw Jsmn::TypeError();
			auto first = route[std::size_t(0)]["amount_msat"];
			if (!Ln::Amount::valid_object(first))
				throw Jsmn::TypeError();
			return Ln::Amount::object(first) - amount;
		});
	}).then([this, offer](Ln::Amount fee) {
		return Streamer::log( bus, Debug
				    , "RpcPaymentClient: fee to %s is %s."
				    , offer.c_str()
				    , std::string(fee).c_str()
				    ).then([fee]() {
			return Ev::lift(fee);
		});
	});
}

Ev::Io<std::string>
RpcPaymentClient::create_invoice( std::string const& counterparty
				, Ln::Amount amount
				, std::string const& memo
				) {
	auto parms = Json::Out()
		.start_object()
			.field("offer", counterparty)
			.field("amount_msat", amount.to_msat())
			.field("payer_note", memo)
		.end_object()
		;
	return remote<std::string>( rpc->command("fetchinvoice", std::move(parms))
				  , [](Jsmn::Object res) {
		return string_field(res, "invoice");
	});
}

Ev::Io<std::string>
RpcPaymentClient::pay_invoice(std::string const& invoice) {
	auto parms = Json::Out()
		.start_object()
			.field("bolt11", invoice)
		.end_object()
		;
	return remote<std::string>( rpc->command("pay", std::move(parms))
				  , [](Jsmn::Object res) {
		return string_field(res, "payment_hash");
	});
}

}}
