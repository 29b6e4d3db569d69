#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief lets other greenthreads run, then
 * resumes.
 *
 * @desc Anything shared with other greenthreads
 * may have changed by the time this returns.
 * The counted form is mostly for tests, to let
 * modules under test make progress.
 */
Ev::Io<void> yield();
Ev::Io<void> yield(std::size_t count);

}

#endif /* !defined(EV_YIELD_HPP) */
