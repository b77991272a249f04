#include"Ledger/Error.hpp"
#include"Ledger/Rounds.hpp"
#include"Sqlite3.hpp"

namespace Ledger { namespace Rounds {

ActiveRound get_active(Sqlite3::Tx& tx) {
	auto rv = ActiveRound::none();
	auto rows = tx.query(R"QRY(
	SELECT round_id FROM giveaway_rounds
	 WHERE status = 'active';
	)QRY").execute();
	for (auto& r : rows) {
		if (rv.exists)
			throw Ledger::InvariantViolation(
				"more than one active round"
			);
		rv = ActiveRound::of(r.get<RoundNumber>(0));
	}
	return rv;
}

RoundNumber highest(Sqlite3::Tx& tx) {
	auto rows = tx.query(R"QRY(
	SELECT COALESCE(MAX(round_id), 0) FROM giveaway_rounds;
	)QRY").execute();
	auto rv = RoundNumber(0);
	for (auto& r : rows)
		rv = r.get<RoundNumber>(0);
	return rv;
}

std::int64_t count_active(Sqlite3::Tx& tx) {
	auto rows = tx.query(R"QRY(
	SELECT COUNT(*) FROM giveaway_rounds WHERE status = 'active';
	)QRY").execute();
	auto rv = std::int64_t(0);
	for (auto& r : rows)
		rv = r.get<std::int64_t>(0);
	return rv;
}

void open(Sqlite3::Tx& tx, RoundNumber n) {
	tx.query(R"QRY(
	UPDATE giveaway_rounds SET status = 'completed'
	 WHERE status = 'active';
	)QRY").execute();
	tx.query(R"QRY(
	INSERT INTO giveaway_rounds (round_id, status)
	VALUES (:n, 'active')
	ON CONFLICT (round_id) DO UPDATE SET status = 'active';
	)QRY")
		.bind(":n", n)
		.execute()
		;
	if (tx.changes() != 1)
		throw Ledger::InvariantViolation(
			"opening a round did not touch exactly one row"
		);
}

}}
