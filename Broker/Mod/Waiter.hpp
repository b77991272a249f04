#ifndef BROKER_MOD_WAITER_HPP
#define BROKER_MOD_WAITER_HPP

#include<cstddef>
#include<memory>

namespace Ev { template<typename a> class Io;}
namespace S { class Bus; }

namespace Broker { namespace Mod {

/** class Broker::Mod::Waiter
 *
 * @brief libev timers for greenthreads.
 */
class Waiter {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	explicit
	Waiter(S::Bus& bus);
	~Waiter();

	/** Broker::Mod::Waiter::wait
	 *
	 * @brief returns after the given number of
	 * seconds.
	 * Throws `Broker::Shutdown` if a shutdown is
	 * raised on the bus first, or was raised
	 * already.
	 */
	Ev::Io<void> wait(double seconds);

	/* Timers currently pending.  */
	std::size_t pending() const;
};

}}

#endif /* !defined(BROKER_MOD_WAITER_HPP) */
