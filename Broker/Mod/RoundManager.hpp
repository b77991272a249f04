#ifndef BROKER_MOD_ROUNDMANAGER_HPP
#define BROKER_MOD_ROUNDMANAGER_HPP

#include"Ledger/Error.hpp"
#include"Ledger/Rounds.hpp"
#include"Util/Either.hpp"
#include<memory>

namespace Broker { namespace Mod { class ConfigStore; }}
namespace Ev { template<typename a> class Io; }
namespace Ledger { class Store; }
namespace S { class Bus; }

namespace Broker { namespace Mod {

/** enum Broker::Mod::RoundPolicy
 *
 * @brief which round numbers `open_round` accepts.
 */
enum RoundPolicy {
	/* Any positive number, including one used before,
	 * which is reactivated.  */
	RoundPolicy_Reopen,
	/* Only numbers above every round opened so far.  */
	RoundPolicy_Strict
};

/** class Broker::Mod::RoundManager
 *
 * @brief opens rounds and reports the active one.
 */
class RoundManager {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	RoundManager() =delete;
	RoundManager(RoundManager const&) =delete;

	RoundManager( S::Bus& bus
		    , Ledger::Store& store
		    , ConfigStore& config
		    , RoundPolicy policy
		    );
	~RoundManager();

	Ev::Io<Util::Either<Ledger::Error, Ledger::ActiveRound>>
	get_active_round();

	/** Broker::Mod::RoundManager::open_round
	 *
	 * @brief completes the active round, if any, and
	 * activates round `n`, in one transaction that
	 * also stores `n` as the `current_round` setting.
	 *
	 * @desc `Error_RoundRejected` if `n` is not
	 * positive, or under the strict policy is not
	 * above every round opened so far.
	 * On any failure the rounds are unchanged.
	 */
	Ev::Io<Util::Either<Ledger::Error, Ledger::RoundNumber>>
	open_round(Ledger::RoundNumber n);
};

}}

#endif /* !defined(BROKER_MOD_ROUNDMANAGER_HPP) */
