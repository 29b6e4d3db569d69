#ifndef STREAMER_MSG_STREAMPARTPAID_HPP
#define STREAMER_MSG_STREAMPARTPAID_HPP

#include"Ln/Amount.hpp"
#include<string>

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::StreamPartPaid
 *
 * @brief funds just left the node for a stream
 * part; anything caching balances or channel
 * state should refresh.
 * Raised without waiting on the subscribers.
 */
struct StreamPartPaid {
	std::string stream_id;
	std::string payment_hash;
	Ln::Amount amount;
};

}}

#endif /* !defined(STREAMER_MSG_STREAMPARTPAID_HPP) */
