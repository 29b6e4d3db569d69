#ifndef EV_NOW_HPP
#define EV_NOW_HPP

namespace Ev {

/** Ev::now
 *
 * @brief wall-clock time in seconds since the
 * epoch.
 */
double now();

}

#endif /* !defined(EV_NOW_HPP) */
