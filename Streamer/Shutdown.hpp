#ifndef STREAMER_SHUTDOWN_HPP
#define STREAMER_SHUTDOWN_HPP

namespace Streamer {

/** struct Streamer::Shutdown
 *
 * @brief raised on the bus when stdin closes; also
 * thrown into actions still waiting on the RPC
 * socket at that point.
 */
struct Shutdown {};

}

#endif /* !defined(STREAMER_SHUTDOWN_HPP) */
