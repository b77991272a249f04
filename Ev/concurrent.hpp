#ifndef EV_CONCURRENT_HPP
#define EV_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::concurrent
 *
 * @brief schedules the given action as a new
 * greenthread, which starts the next time the
 * current greenthread yields.
 *
 * @desc Exceptions escaping the new greenthread
 * are reported on stderr and the loop keeps
 * going.
 */
Ev::Io<void> concurrent(Ev::Io<void> io);

}

#endif /* EV_CONCURRENT_HPP */
