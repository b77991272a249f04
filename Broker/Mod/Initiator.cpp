#include"Broker/Mod/ConfigStore.hpp"
#include"Broker/Mod/Initiator.hpp"
#include"Broker/Mod/RoundManager.hpp"
#include"Broker/Msg/Init.hpp"
#include"Broker/ledger_call.hpp"
#include"Broker/log.hpp"
#include"Ev/Io.hpp"
#include"Ledger/Rounds.hpp"
#include"Ledger/Schema.hpp"
#include"Ledger/Store.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/make_unique.hpp"

namespace {

void check(Ledger::Error e, char const* step) {
	throw Broker::Mod::Initiator::Failed(
		std::string(step) + ": " + Ledger::error_reason(e)
	);
}

}

namespace Broker { namespace Mod {

class Initiator::Impl {
private:
	S::Bus& bus;
	Ledger::Store& store;
	ConfigStore& config;
	RoundManager& rounds;

	void start() {
		bus.subscribe<Msg::Init>([this](Msg::Init const& m) {
			return init(m.db_path);
		});
	}

	Ev::Io<void> init(std::string const& db_path) {
		typedef Util::Either<Ledger::Error, bool> SchemaResult;
		auto act = store.transact<SchemaResult>([](Sqlite3::Tx& tx) {
			auto upgraded = Ledger::Schema::create(tx);
			tx.commit();
			return SchemaResult::right(upgraded);
		});
		return ledger_call(bus, "Initiator", act).then([this, db_path](SchemaResult r) {
			if (r.is_left())
				check(r.left(), "schema");
			auto act = Broker::log( bus, Info
					      , "Initiator: database %s ready."
					      , db_path.c_str()
					      );
			if (r.right())
				act += Broker::log( bus, Info
						  , "Initiator: added claim_round "
						    "to an older keys table."
						  );
			return act + config.load();
		}).then([this](Util::Either<Ledger::Error, std::size_t> r) {
			if (r.is_left())
				check(r.left(), "settings");
			return rounds.get_active_round();
		}).then([this](Util::Either<Ledger::Error, Ledger::ActiveRound> r) {
			if (r.is_left())
				check(r.left(), "active round");
			auto active = r.right();
			if (active.exists)
				return Broker::log( bus, Info
						  , "Initiator: round %lld is active."
						  , (long long) active.number
						  ).then([active]() {
					return Ev::lift(Util::Either<Ledger::Error, Ledger::RoundNumber>::right(active.number));
				});
			return open_next_round();
		}).then([](Util::Either<Ledger::Error, Ledger::RoundNumber> r) {
			if (r.is_left())
				check(r.left(), "opening a round");
			return Ev::lift();
		});
	}

	/* Round 1 on a new database; past the highest
	 * completed round otherwise, which any policy
	 * accepts.  */
	Ev::Io<Util::Either<Ledger::Error, Ledger::RoundNumber>>
	open_next_round() {
		typedef Util::Either<Ledger::Error, Ledger::RoundNumber> R;
		auto act = store.transact<R>([](Sqlite3::Tx& tx) {
			auto next = Ledger::Rounds::highest(tx) + 1;
			tx.commit();
			return R::right(next);
		});
		return ledger_call(bus, "Initiator", act).then([this](R r) {
			if (r.is_left())
				check(r.left(), "highest round");
			auto n = r.right();
			return Broker::log( bus, Info
					  , "Initiator: no active round, "
					    "opening round %lld."
					  , (long long) n
					  ) + rounds.open_round(n);
		});
	}

public:
	Impl( S::Bus& bus_
	    , Ledger::Store& store_
	    , ConfigStore& config_
	    , RoundManager& rounds_
	    ) : bus(bus_), store(store_), config(config_), rounds(rounds_)
	      { start(); }
};

Initiator::Initiator( S::Bus& bus
		    , Ledger::Store& store
		    , ConfigStore& config
		    , RoundManager& rounds
		    ) : pimpl(Util::make_unique<Impl>(bus, store, config, rounds))
		      { }
Initiator::~Initiator() { }

}}
