#undef NDEBUG
#include"Broker/Mod/ConfigStore.hpp"
#include"Broker/Mod/RoundManager.hpp"
#include"Ev/Io.hpp"
#include"Ev/map.hpp"
#include"Ev/start.hpp"
#include"Ledger/Rounds.hpp"
#include"Ledger/Schema.hpp"
#include"Ledger/Store.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include<assert.h>
#include<cstdint>
#include<vector>

namespace {

typedef Util::Either<Ledger::Error, Ledger::RoundNumber> OpenResult;
typedef Util::Either<Ledger::Error, Ledger::ActiveRound> ActiveResult;

Ev::Io<std::int64_t> count_active(Ledger::Store& store) {
	return store.transact<std::int64_t>([](Sqlite3::Tx& tx) {
		auto rv = Ledger::Rounds::count_active(tx);
		tx.commit();
		return rv;
	});
}

}

int main() {
	auto bus = S::Bus();
	Ledger::Store store(":memory:", 2);
	Broker::Mod::ConfigStore config(bus, store, Ledger::Settings());
	Broker::Mod::RoundManager reopen( bus, store, config
					, Broker::Mod::RoundPolicy_Reopen
					);
	Broker::Mod::RoundManager strict( bus, store, config
					, Broker::Mod::RoundPolicy_Strict
					);

	auto code = Ev::lift().then([&]() {
		return store.transact<bool>([](Sqlite3::Tx& tx) {
			Ledger::Schema::create(tx);
			tx.commit();
			return true;
		});
	}).then([&](bool) {
		return reopen.get_active_round();
	}).then([&](ActiveResult r) {
		assert(r == ActiveResult::right(Ledger::ActiveRound::none()));

		/* Only positive numbers.  */
		return reopen.open_round(0);
	}).then([&](OpenResult r) {
		assert(r == OpenResult::left(Ledger::Error_RoundRejected));
		return reopen.open_round(-3);
	}).then([&](OpenResult r) {
		assert(r == OpenResult::left(Ledger::Error_RoundRejected));

		/* Many administrators at once.  */
		auto ns = std::vector<Ledger::RoundNumber>();
		for (auto i = 1; i <= 20; ++i)
			ns.push_back(i);
		return Ev::map([&](Ledger::RoundNumber n) {
			return reopen.open_round(n);
		}, std::move(ns));
	}).then([&](std::vector<OpenResult> rs) {
		for (auto const& r : rs)
			assert(r.is_right());
		return count_active(store);
	}).then([&](std::int64_t n) {
		/* Exactly one survivor.  */
		assert(n == 1);
		return reopen.get_active_round();
	}).then([&](ActiveResult r) {
		assert(r.is_right());
		assert(r.right().exists);
		auto active = r.right().number;
		assert(active >= 1 && active <= 20);
		/* The setting follows the round.  */
		auto current = config.get("current_round");
		assert(current);
		assert(*current == std::to_string(active));
		assert(config.settings().current_round == active);

		/* Reopening an earlier number is allowed by default.  */
		return reopen.open_round(5);
	}).then([&](OpenResult r) {
		assert(r == OpenResult::right(5));
		return reopen.get_active_round();
	}).then([&](ActiveResult r) {
		assert(r == ActiveResult::right(Ledger::ActiveRound::of(5)));
		return count_active(store);
	}).then([&](std::int64_t n) {
		assert(n == 1);

		/* Strict: nothing at or below the highest ever opened.  */
		return strict.open_round(20);
	}).then([&](OpenResult r) {
		assert(r == OpenResult::left(Ledger::Error_RoundRejected));
		return strict.open_round(7);
	}).then([&](OpenResult r) {
		assert(r == OpenResult::left(Ledger::Error_RoundRejected));
		return strict.get_active_round();
	}).then([&](ActiveResult r) {
		/* A refusal leaves the active round alone.  */
		assert(r == ActiveResult::right(Ledger::ActiveRound::of(5)));
		assert(*config.get("current_round") == "5");
		return strict.open_round(21);
	}).then([&](OpenResult r) {
		assert(r == OpenResult::right(21));
		assert(config.settings().current_round == 21);
		return strict.get_active_round();
	}).then([&](ActiveResult r) {
		assert(r == ActiveResult::right(Ledger::ActiveRound::of(21)));

		/* Make the second half of the rollover fail.  */
		return store.transact<bool>([](Sqlite3::Tx& tx) {
			tx.query_execute(R"QRY(
			CREATE TRIGGER freeze_config BEFORE UPDATE ON config
			BEGIN SELECT RAISE(ABORT, 'config is frozen'); END;
			)QRY");
			tx.commit();
			return true;
		});
	}).then([&](bool) {
		return reopen.open_round(22);
	}).then([&](OpenResult r) {
		assert(r == OpenResult::left(Ledger::Error_TransactionFailed));
		return reopen.get_active_round();
	}).then([&](ActiveResult r) {
		/* Nothing of the failed rollover is kept.  */
		assert(r == ActiveResult::right(Ledger::ActiveRound::of(21)));
		assert(*config.get("current_round") == "21");
		return store.transact<std::int64_t>([](Sqlite3::Tx& tx) {
			auto rv = Ledger::Rounds::highest(tx);
			tx.commit();
			return rv;
		});
	}).then([&](std::int64_t highest) {
		assert(highest == 21);
		return count_active(store);
	}).then([&](std::int64_t n) {
		assert(n == 1);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
