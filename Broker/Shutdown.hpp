#ifndef BROKER_SHUTDOWN_HPP
#define BROKER_SHUTDOWN_HPP

namespace Broker {

/** struct Broker::Shutdown
 *
 * @brief raised on the bus when the console
 * reaches end-of-file, and thrown out of blocked
 * waits (`Broker::Mod::Waiter::wait`) so that
 * periodic loops end.
 */
struct Shutdown {};

}

#endif /* !defined(BROKER_SHUTDOWN_HPP) */
