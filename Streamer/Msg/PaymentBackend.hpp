#ifndef STREAMER_MSG_PAYMENTBACKEND_HPP
#define STREAMER_MSG_PAYMENTBACKEND_HPP

namespace Streamer { class PaymentClient; }

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::PaymentBackend
 *
 * @brief announces the payment client that stream
 * operations use.
 * Until this is raised, preparing a stream fails
 * with NoBackendConnection.
 */
struct PaymentBackend {
	Streamer::PaymentClient& client;
};

}}

#endif /* !defined(STREAMER_MSG_PAYMENTBACKEND_HPP) */
