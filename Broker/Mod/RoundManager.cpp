#include"Broker/Mod/ConfigStore.hpp"
#include"Broker/Mod/RoundManager.hpp"
#include"Broker/ledger_call.hpp"
#include"Broker/log.hpp"
#include"Ev/Io.hpp"
#include"Ledger/Config.hpp"
#include"Ledger/Store.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/make_unique.hpp"
#include<string>

namespace Broker { namespace Mod {

class RoundManager::Impl {
private:
	S::Bus& bus;
	Ledger::Store& store;
	ConfigStore& config;
	RoundPolicy policy;

	typedef Util::Either<Ledger::Error, Ledger::RoundNumber> OpenResult;

	Ev::Io<OpenResult> reject(Ledger::RoundNumber n, char const* why) {
		return Broker::log( bus, Info
				  , "RoundManager: round %lld rejected: %s"
				  , (long long) n, why
				  ).then([]() {
			return Ev::lift(OpenResult::left(Ledger::Error_RoundRejected));
		});
	}

public:
	Impl( S::Bus& bus_
	    , Ledger::Store& store_
	    , ConfigStore& config_
	    , RoundPolicy policy_
	    ) : bus(bus_), store(store_), config(config_), policy(policy_)
	      { }

	Ev::Io<Util::Either<Ledger::Error, Ledger::ActiveRound>>
	get_active_round() {
		typedef Util::Either<Ledger::Error, Ledger::ActiveRound> R;
		return ledger_call(bus, "RoundManager", store.transact<R>([](Sqlite3::Tx& tx) {
			auto rv = Ledger::Rounds::get_active(tx);
			tx.commit();
			return R::right(rv);
		}));
	}

	Ev::Io<OpenResult> open_round(Ledger::RoundNumber n) {
		if (n < 1)
			return reject(n, "not a positive number");

		auto strict = (policy == RoundPolicy_Strict);
		/* Left of RoundRejected here means the strict
		 * policy refused it.  */
		auto act = store.transact<OpenResult>([n, strict](Sqlite3::Tx& tx) {
			if (strict && n <= Ledger::Rounds::highest(tx))
				return OpenResult::left(Ledger::Error_RoundRejected);
			Ledger::Rounds::open(tx, n);
			Ledger::Config::put(tx, "current_round", std::to_string(n));
			tx.commit();
			return OpenResult::right(n);
		});
		return ledger_call(bus, "RoundManager", act).then([this, n](OpenResult r) {
			if (r.is_left()) {
				if (r.left() == Ledger::Error_RoundRejected)
					return reject(n, "not above every earlier round");
				return Ev::lift(r);
			}
			config.refresh("current_round", std::to_string(n));
			return Broker::log( bus, Info
					  , "RoundManager: round %lld is now active."
					  , (long long) n
					  ).then([r]() {
				return Ev::lift(r);
			});
		});
	}
};

RoundManager::RoundManager( S::Bus& bus
			  , Ledger::Store& store
			  , ConfigStore& config
			  , RoundPolicy policy
			  ) : pimpl(Util::make_unique<Impl>(bus, store, config, policy))
			    { }
RoundManager::~RoundManager() { }

Ev::Io<Util::Either<Ledger::Error, Ledger::ActiveRound>>
RoundManager::get_active_round() {
	return pimpl->get_active_round();
}
Ev::Io<Util::Either<Ledger::Error, Ledger::RoundNumber>>
RoundManager::open_round(Ledger::RoundNumber n) {
	return pimpl->open_round(n);
}

}}
