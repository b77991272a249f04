#include"Broker/Mod/Claimer.hpp"
#include"Broker/ledger_call.hpp"
#include"Broker/log.hpp"
#include"Ev/Io.hpp"
#include"Ledger/Inventory.hpp"
#include"Ledger/Rounds.hpp"
#include"Ledger/Store.hpp"
#include"Ledger/Users.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"

namespace Broker { namespace Mod {

class Claimer::Impl {
private:
	S::Bus& bus;
	Ledger::Store& store;

	static
	Result claim_in(Sqlite3::Tx& tx, std::string const& user, bool checked) {
		auto uid = Ledger::Users::ensure(tx, user);
		auto round = Ledger::Rounds::get_active(tx);

		auto key = checked
			 ? Ledger::Inventory::select_unclaimed_excluding(tx, uid)
			 : Ledger::Inventory::select_unclaimed(tx)
			 ;
		if (!key) {
			auto why = Ledger::Error_PoolExhausted;
			if (checked && Ledger::Inventory::count_unclaimed(tx) > 0)
				why = Ledger::Error_AlreadyClaimedThisRound;
			/* Keep the user registration.  */
			tx.commit();
			return Result::left(why);
		}

		Ledger::Inventory::bind(tx, *key, uid, round);
		tx.commit();
		return Result::right(*key);
	}

public:
	Impl(S::Bus& bus_, Ledger::Store& store_)
		: bus(bus_), store(store_) { }

	Ev::Io<Result> claim(std::string const& user, bool checked) {
		auto what = checked ? "claim" : "grant";
		if (Util::Str::trim(user).empty())
			return Broker::log( bus, Debug
					  , "Claimer: %s refused: no user name."
					  , what
					  ).then([]() {
				return Ev::lift(Result::left(Ledger::Error_Ineligible));
			});

		auto act = store.transact<Result>([user, checked](Sqlite3::Tx& tx) {
			return claim_in(tx, user, checked);
		});
		return ledger_call(bus, "Claimer", act).then([this, user, what](Result r) {
			auto outcome = r.is_right()
				     ? r.right()
				     : std::string(Ledger::error_reason(r.left()))
				     ;
			return Broker::log( bus, Debug
					  , "Claimer: %s by '%s': %s %s"
					  , what, user.c_str()
					  , r.is_right() ? "got" : "failed"
					  , outcome.c_str()
					  ).then([r]() {
				return Ev::lift(r);
			});
		});
	}

	Ev::Io<Util::Either<Ledger::Error, std::int64_t>> count_unclaimed() {
		typedef Util::Either<Ledger::Error, std::int64_t> R;
		return ledger_call(bus, "Claimer", store.transact<R>([](Sqlite3::Tx& tx) {
			auto rv = Ledger::Inventory::count_unclaimed(tx);
			tx.commit();
			return R::right(rv);
		}));
	}
};

Claimer::Claimer(S::Bus& bus, Ledger::Store& store)
	: pimpl(Util::make_unique<Impl>(bus, store)) { }
Claimer::~Claimer() { }

Ev::Io<Claimer::Result> Claimer::claim(std::string const& user) {
	return pimpl->claim(user, true);
}
Ev::Io<Claimer::Result> Claimer::claim_unchecked(std::string const& user) {
	return pimpl->claim(user, false);
}
Ev::Io<Util::Either<Ledger::Error, std::int64_t>> Claimer::count_unclaimed() {
	return pimpl->count_unclaimed();
}

}}
