#ifndef STREAMER_MOD_RPCPAYMENTCLIENT_HPP
#define STREAMER_MOD_RPCPAYMENTCLIENT_HPP

#include"Streamer/PaymentClient.hpp"

namespace S { class Bus; }
namespace Streamer { namespace Mod { class Rpc; }}

namespace Streamer { namespace Mod {

/** class Streamer::Mod::RpcPaymentClient
 *
 * @brief pays stream parts through lightningd.
 *
 * @desc The counterparty is a BOLT12 offer; each
 * part is paid by fetching an invoice from the
 * offer and paying it.
 * Announces itself with Streamer::Msg::PaymentBackend
 * once `init` has connected the RPC socket.
 */
class RpcPaymentClient : public PaymentClient {
private:
	S::Bus& bus;
	Rpc* rpc;

	void start();

public:
	RpcPaymentClient() =delete;
	RpcPaymentClient(RpcPaymentClient const&) =delete;

	explicit
	RpcPaymentClient(S::Bus& bus_) : bus(bus_), rpc(nullptr) {
		start();
	}

	Ev::Io<Ln::Amount> quote_fee( std::string const& counterparty
				    , Ln::Amount amount
				    ) override;
	Ev::Io<std::string> create_invoice( std::string const& counterparty
					  , Ln::Amount amount
					  , std::string const& memo
					  ) override;
	Ev::Io<std::string> pay_invoice(std::string const& invoice) override;
};

}}

#endif /* !defined(STREAMER_MOD_RPCPAYMENTCLIENT_HPP) */
