#ifndef EV_CONCURRENT_HPP
#define EV_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::concurrent
 *
 * @brief launches the given action as a new
 * greenthread once the current one yields, and
 * returns immediately.
 *
 * @desc Exceptions escaping the new greenthread
 * are reported on stderr; the main loop keeps
 * running.
 */
Ev::Io<void> concurrent(Ev::Io<void> io);

}

#endif /* EV_CONCURRENT_HPP */
