#ifndef STREAMER_PAYMENTCLIENT_HPP
#define STREAMER_PAYMENTCLIENT_HPP

#include<string>

namespace Ev { template<typename a> class Io; }
namespace Ln { class Amount; }

namespace Streamer {

/** class Streamer::PaymentClient
 *
 * @brief the remote calls a stream makes.
 *
 * @desc Each call may take arbitrarily long and
 * fails with Streamer::PaymentClientError.
 * The production implementation talks to
 * lightningd; tests substitute their own.
 */
class PaymentClient {
public:
	virtual ~PaymentClient() { }

	/* Routing fee for paying `amount` to the
	 * counterparty.  */
	virtual
	Ev::Io<Ln::Amount> quote_fee( std::string const& counterparty
				    , Ln::Amount amount
				    ) =0;
	/* Asks the counterparty for an invoice.  */
	virtual
	Ev::Io<std::string> create_invoice( std::string const& counterparty
					  , Ln::Amount amount
					  , std::string const& memo
					  ) =0;
	/* Pays the invoice, yielding the payment hash.  */
	virtual
	Ev::Io<std::string> pay_invoice(std::string const& invoice) =0;
};

}

#endif /* !defined(STREAMER_PAYMENTCLIENT_HPP) */
