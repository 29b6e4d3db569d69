#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the given action as the first
 * greenthread of the default libev loop, then
 * keeps the loop running until no watchers
 * remain.
 *
 * @return the integer the action yields, 254 if
 * it threw, or 255 if libev could not start.
 */
int start(Ev::Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
