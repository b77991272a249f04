#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the libev default loop with the
 * given action as the first greenthread.
 *
 * @desc Returns when the loop has no more active
 * watchers.
 * The return value is the exit code produced by
 * the action, 254 if the action threw, or 255 if
 * the loop could not be initialized.
 */
int start(Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
