#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief suspends the current greenthread until
 * the next loop iteration, letting others run.
 *
 * @desc Shared state may have changed by the time
 * the action returns.
 *
 * The counted form yields repeatedly, which is
 * mostly useful in tests that need other modules
 * to make progress.
 */
Ev::Io<void> yield();

Ev::Io<void> yield(std::size_t num_yields);

}

#endif /* !defined(EV_YIELD_HPP) */
