#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ledger/Error.hpp"
#include"Ledger/Rounds.hpp"
#include"Ledger/Schema.hpp"
#include"Sqlite3.hpp"
#include<assert.h>
#include<sqlite3.h>

int main() {
	auto db = Sqlite3::Db(":memory:");

	auto code = db.transact().then([&](Sqlite3::Tx tx) {
		Ledger::Schema::create(tx);

		assert(Ledger::Rounds::get_active(tx) == Ledger::ActiveRound::none());
		assert(Ledger::Rounds::highest(tx) == 0);
		assert(Ledger::Rounds::count_active(tx) == 0);

		Ledger::Rounds::open(tx, 1);
		assert(Ledger::Rounds::get_active(tx) == Ledger::ActiveRound::of(1));
		Ledger::Rounds::open(tx, 4);
		assert(Ledger::Rounds::get_active(tx) == Ledger::ActiveRound::of(4));
		assert(Ledger::Rounds::count_active(tx) == 1);
		assert(Ledger::Rounds::highest(tx) == 4);

		/* Reopening keeps one row per number.  */
		Ledger::Rounds::open(tx, 1);
		assert(Ledger::Rounds::get_active(tx) == Ledger::ActiveRound::of(1));
		assert(Ledger::Rounds::count_active(tx) == 1);
		auto fetch = tx.query("SELECT COUNT(*) FROM giveaway_rounds;")
			.execute();
		for (auto& r : fetch)
			assert(r.get<int>(0) == 2);

		/* Reopening the active one is harmless.  */
		Ledger::Rounds::open(tx, 1);
		assert(Ledger::Rounds::get_active(tx) == Ledger::ActiveRound::of(1));

		/* The database itself refuses a second active row.  */
		auto threw = false;
		try {
			tx.query_execute(R"QRY(
			UPDATE giveaway_rounds SET status = 'active'
			 WHERE round_id = 4;
			)QRY");
		} catch (Sqlite3::Error const& e) {
			threw = true;
			assert(e.primary() == SQLITE_CONSTRAINT);
		}
		assert(threw);
		assert(Ledger::Rounds::count_active(tx) == 1);

		tx.commit();
		return Ev::lift(0);
	});

	return Ev::start(code);
}
