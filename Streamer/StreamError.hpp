#ifndef STREAMER_STREAMERROR_HPP
#define STREAMER_STREAMERROR_HPP

#include<stdexcept>
#include<string>

namespace Streamer {

enum StreamErrorCode {
	/* No payment client yet.  */
	Error_NoBackendConnection,
	Error_FeeQuote,
	Error_MissingDraft,
	/* A tick found its stream gone.  */
	Error_NotInStore,
	/* Invoice request could not reach the counterparty.  */
	Error_RemoteOffline,
	/* Watchdog fired.  */
	Error_RemoteNotResponding,
	/* Any other invoice or payment failure, text as
	 * the backend gave it.  */
	Error_Remote
};

/* "NoBackendConnection", "FeeQuoteError", ...  */
char const* error_code_name(StreamErrorCode);

/** struct Streamer::StreamError
 *
 * @brief failure of a stream operation.
 */
struct StreamError : public std::runtime_error {
	StreamErrorCode code;

	StreamError(StreamErrorCode code_, std::string const& msg)
		: std::runtime_error(msg), code(code_) { }
	/* With the fixed text for the code.  */
	explicit
	StreamError(StreamErrorCode code_);
};

/** struct Streamer::PaymentClientError
 *
 * @brief a remote payment call failed; the text is
 * the backend's.
 */
struct PaymentClientError : public std::runtime_error {
	explicit
	PaymentClientError(std::string const& msg)
		: std::runtime_error(msg) { }
};

/* Whether an invoice-request failure means the
 * counterparty could not be reached at all.  */
bool is_remote_offline(std::string const& error_text);

}

#endif /* !defined(STREAMER_STREAMERROR_HPP) */
