#ifndef STREAMER_MSG_STREAMERROR_HPP
#define STREAMER_MSG_STREAMERROR_HPP

#include<string>

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::StreamError
 *
 * @brief raised when a stream is paused because of
 * a failure.
 * `category` is always "stream_error"; `error`
 * names the kind of failure.
 */
struct StreamError {
	std::string category;
	std::string stream_id;
	std::string error;
	std::string message;
};

}}

#endif /* !defined(STREAMER_MSG_STREAMERROR_HPP) */
