#undef NDEBUG
#include"Broker/Mod/Claimer.hpp"
#include"Broker/Mod/ConfigStore.hpp"
#include"Broker/Mod/Initiator.hpp"
#include"Broker/Mod/RoundManager.hpp"
#include"Broker/Msg/Init.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ledger/Inventory.hpp"
#include"Ledger/Store.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include<assert.h>
#include<cstdint>
#include<string>
#include<utility>

namespace {

Ev::Io<void> add_key(Ledger::Store& store, std::string key) {
	return store.transact<bool>([key](Sqlite3::Tx& tx) {
		Ledger::Inventory::ingest(tx, key);
		tx.commit();
		return true;
	}).then([](bool) {
		return Ev::lift();
	});
}

/* Who holds the key, and in which round (0 if none).  */
Ev::Io<std::pair<std::string, std::int64_t>>
holder(Ledger::Store& store, std::string key) {
	typedef std::pair<std::string, std::int64_t> R;
	return store.transact<R>([key](Sqlite3::Tx& tx) {
		auto rv = R();
		auto fetch = tx.query(R"QRY(
		SELECT u.username, k.claim_round
		  FROM keys k JOIN users u ON k.user_claim = u.id
		 WHERE k.key_val = :key;
		)QRY")
			.bind(":key", key)
			.execute()
			;
		for (auto& r : fetch) {
			rv.first = r.get<std::string>(0);
			rv.second = r.is_null(1) ? 0 : r.get<std::int64_t>(1);
		}
		tx.commit();
		return rv;
	});
}

}

int main() {
	auto bus = S::Bus();
	Ledger::Store store(":memory:", 4);
	Broker::Mod::ConfigStore config(bus, store, Ledger::Settings());
	Broker::Mod::RoundManager rounds( bus, store, config
					, Broker::Mod::RoundPolicy_Reopen
					);
	Broker::Mod::Initiator initiator(bus, store, config, rounds);
	Broker::Mod::Claimer claimer(bus, store);

	typedef Broker::Mod::Claimer::Result Result;

	auto first = std::string();
	auto second = std::string();

	auto code = Ev::lift().then([&]() {
		return bus.raise(Broker::Msg::Init{":memory:"});
	}).then([&]() {
		return rounds.get_active_round();
	}).then([&](Util::Either<Ledger::Error, Ledger::ActiveRound> r) {
		/* Startup opened round 1.  */
		assert(r.is_right());
		assert(r.right() == Ledger::ActiveRound::of(1));

		/* Nothing to give yet.  */
		return claimer.claim("alice");
	}).then([&](Result r) {
		assert(r == Result::left(Ledger::Error_PoolExhausted));

		return add_key(store, "K1") + add_key(store, "K2");
	}).then([&]() {
		return claimer.claim("alice");
	}).then([&](Result r) {
		assert(r.is_right());
		first = r.right();
		assert(first == "K1" || first == "K2");

		/* One per round.  */
		return claimer.claim("alice");
	}).then([&](Result r) {
		assert(r == Result::left(Ledger::Error_AlreadyClaimedThisRound));

		return claimer.claim("bob");
	}).then([&](Result r) {
		assert(r.is_right());
		second = r.right();
		assert(second != first);
		assert(second == "K1" || second == "K2");

		return claimer.claim("carol");
	}).then([&](Result r) {
		assert(r == Result::left(Ledger::Error_PoolExhausted));
		return holder(store, first);
	}).then([&](std::pair<std::string, std::int64_t> h) {
		assert(h.first == "alice");
		assert(h.second == 1);

		return rounds.open_round(2);
	}).then([&](Util::Either<Ledger::Error, Ledger::RoundNumber> r) {
		assert(r.is_right());
		assert(r.right() == 2);

		/* New round but still nothing left.  */
		return claimer.claim("alice");
	}).then([&](Result r) {
		assert(r == Result::left(Ledger::Error_PoolExhausted));

		return add_key(store, "K3") + add_key(store, "K4");
	}).then([&]() {
		return claimer.claim("alice");
	}).then([&](Result r) {
		assert(r.is_right());
		assert(r.right() == "K3" || r.right() == "K4");
		first = r.right();
		return holder(store, first);
	}).then([&](std::pair<std::string, std::int64_t> h) {
		assert(h.first == "alice");
		assert(h.second == 2);

		return claimer.claim("alice");
	}).then([&](Result r) {
		assert(r == Result::left(Ledger::Error_AlreadyClaimedThisRound));

		/* Administrator override ignores the round limit.  */
		return claimer.claim_unchecked("alice");
	}).then([&](Result r) {
		assert(r.is_right());
		assert(r.right() != first);
		assert(r.right() == "K3" || r.right() == "K4");

		return claimer.claim_unchecked("alice");
	}).then([&](Result r) {
		assert(r == Result::left(Ledger::Error_PoolExhausted));

		/* No name, no key.  */
		return claimer.claim("   ");
	}).then([&](Result r) {
		assert(r == Result::left(Ledger::Error_Ineligible));
		return claimer.count_unclaimed();
	}).then([&](Util::Either<Ledger::Error, std::int64_t> r) {
		assert(r == (Util::Either<Ledger::Error, std::int64_t>::right(0)));
		return Ev::lift(0);
	});

	return Ev::start(code);
}
