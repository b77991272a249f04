#ifndef BROKER_MOD_ALL_HPP
#define BROKER_MOD_ALL_HPP

#include<memory>
#include<ostream>

namespace Broker { struct Options; }
namespace Ev { class ThreadPool; }
namespace Ledger { class Store; }
namespace S { class Bus; }

namespace Broker { namespace Mod {

/** Broker::Mod::all
 *
 * @brief Constructs all the modules of the broker.
 * Returns a shared pointer to an object that
 * cleans up all modules on destruction.
 */
std::shared_ptr<void> all( std::ostream& cout
			 , std::ostream& cerr
			 , S::Bus& bus
			 , Ev::ThreadPool& threadpool
			 , Ledger::Store& store
			 , Broker::Options const& options
			 );

}}

#endif /* !defined(BROKER_MOD_ALL_HPP) */
