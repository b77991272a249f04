#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ledger/Error.hpp"
#include"Ledger/Inventory.hpp"
#include"Ledger/Rounds.hpp"
#include"Ledger/Schema.hpp"
#include"Ledger/Users.hpp"
#include"Sqlite3.hpp"
#include<assert.h>

int main() {
	auto db = Sqlite3::Db(":memory:");

	auto code = db.transact().then([&](Sqlite3::Tx tx) {
		assert(!Ledger::Schema::create(tx));

		assert(Ledger::Inventory::count_all(tx) == 0);
		assert(!Ledger::Inventory::select_unclaimed(tx));

		assert(Ledger::Inventory::ingest(tx, "K1") == Ledger::Ingest_Inserted);
		assert(Ledger::Inventory::ingest(tx, "K2") == Ledger::Ingest_Inserted);
		assert(Ledger::Inventory::ingest(tx, "K1") == Ledger::Ingest_AlreadyPresent);
		assert(Ledger::Inventory::count_all(tx) == 2);
		assert(Ledger::Inventory::count_unclaimed(tx) == 2);

		/* Users are registered once.  */
		auto alice = Ledger::Users::ensure(tx, "alice");
		assert(Ledger::Users::ensure(tx, "alice") == alice);
		auto bob = Ledger::Users::ensure(tx, "bob");
		assert(bob != alice);
		assert(Ledger::Users::count(tx) == 2);

		Ledger::Rounds::open(tx, 1);
		auto round = Ledger::Rounds::get_active(tx);

		auto key = Ledger::Inventory::select_unclaimed_excluding(tx, alice);
		assert(key);
		Ledger::Inventory::bind(tx, *key, alice, round);
		assert(Ledger::Inventory::count_unclaimed(tx) == 1);

		/* Alice already holds a key from this round.  */
		assert(!Ledger::Inventory::select_unclaimed_excluding(tx, alice));
		/* Others, and the unchecked path, still see one.  */
		auto other = Ledger::Inventory::select_unclaimed_excluding(tx, bob);
		assert(other);
		assert(*other != *key);
		assert(Ledger::Inventory::select_unclaimed(tx));

		/* Binding a claimed key is refused.  */
		auto threw = false;
		try {
			Ledger::Inventory::bind(tx, *key, bob, round);
		} catch (Ledger::InvariantViolation const&) {
			threw = true;
		}
		assert(threw);
		assert(Ledger::Inventory::count_unclaimed(tx) == 1);

		/* So is binding an unknown key.  */
		threw = false;
		try {
			Ledger::Inventory::bind(tx, "K404", bob, round);
		} catch (Ledger::InvariantViolation const&) {
			threw = true;
		}
		assert(threw);

		/* A new round lifts the exclusion.  */
		Ledger::Rounds::open(tx, 2);
		auto again = Ledger::Inventory::select_unclaimed_excluding(tx, alice);
		assert(again);
		assert(*again == *other);

		/* With no active round nobody is excluded.  */
		tx.query_execute("UPDATE giveaway_rounds SET status = 'completed';");
		assert(Ledger::Rounds::get_active(tx) == Ledger::ActiveRound::none());
		Ledger::Inventory::bind(tx, *again, alice, Ledger::ActiveRound::none());
		assert(Ledger::Inventory::count_unclaimed(tx) == 0);
		assert(!Ledger::Inventory::select_unclaimed(tx));

		auto fetch = tx.query(R"QRY(
		SELECT claim_round, claimed_at FROM keys WHERE key_val = :key;
		)QRY")
			.bind(":key", *again)
			.execute()
			;
		auto rows = 0;
		for (auto& r : fetch) {
			++rows;
			assert(r.is_null(0));
			assert(!r.is_null(1));
		}
		assert(rows == 1);

		tx.commit();
		return Ev::lift(0);
	});

	return Ev::start(code);
}
