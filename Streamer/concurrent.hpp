#ifndef STREAMER_CONCURRENT_HPP
#define STREAMER_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Streamer {

/** Streamer::concurrent
 *
 * @brief Ev::concurrent, except that a
 * Streamer::Shutdown escaping the new greenthread
 * is ignored.
 */
Ev::Io<void> concurrent(Ev::Io<void>);

}

#endif /* !defined(STREAMER_CONCURRENT_HPP) */
