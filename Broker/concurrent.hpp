#ifndef BROKER_CONCURRENT_HPP
#define BROKER_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Broker {

/** Broker::concurrent
 *
 * @brief like `Ev::concurrent`, but a
 * `Broker::Shutdown` escaping the new greenthread
 * ends it quietly.
 */
Ev::Io<void> concurrent(Ev::Io<void>);

}

#endif /* !defined(BROKER_CONCURRENT_HPP) */
