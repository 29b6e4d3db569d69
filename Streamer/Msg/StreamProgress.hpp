#ifndef STREAMER_MSG_STREAMPROGRESS_HPP
#define STREAMER_MSG_STREAMPROGRESS_HPP

#include<cstddef>
#include<string>

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::StreamProgress
 *
 * @brief raised after each part of a stream is
 * paid.
 */
struct StreamProgress {
	std::string stream_id;
	std::size_t parts_paid;
	std::size_t total_parts;
};

}}

#endif /* !defined(STREAMER_MSG_STREAMPROGRESS_HPP) */
