#ifndef BROKER_MOD_INITIATOR_HPP
#define BROKER_MOD_INITIATOR_HPP

#include"Util/BacktraceException.hpp"
#include<memory>
#include<stdexcept>
#include<string>

namespace Broker { namespace Mod { class ConfigStore; }}
namespace Broker { namespace Mod { class RoundManager; }}
namespace Ledger { class Store; }
namespace S { class Bus; }

namespace Broker { namespace Mod {

/** class Broker::Mod::Initiator
 *
 * @brief handles `Broker::Msg::Init`: creates or
 * upgrades the schema, loads the settings mirror,
 * and opens a round if none is active: round 1 on
 * a new database, else one past the highest.
 *
 * @desc If any step fails the raise of `Init`
 * throws `Initiator::Failed`.
 */
class Initiator {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Initiator() =delete;
	Initiator(Initiator const&) =delete;

	Initiator( S::Bus& bus
		 , Ledger::Store& store
		 , ConfigStore& config
		 , RoundManager& rounds
		 );
	~Initiator();

	struct Failed : public Util::BacktraceException<std::runtime_error> {
		explicit
		Failed(std::string const& msg)
			: Util::BacktraceException<std::runtime_error>(
				"Initiator: " + msg
			  ) { }
	};
};

}}

#endif /* !defined(BROKER_MOD_INITIATOR_HPP) */
