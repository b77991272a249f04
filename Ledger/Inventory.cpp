#include"Ledger/Error.hpp"
#include"Ledger/Inventory.hpp"
#include"Sqlite3.hpp"
#include"Util/make_unique.hpp"

namespace {

std::int64_t single_count(Sqlite3::Tx& tx, char const* sql) {
	auto rows = tx.query(sql).execute();
	auto rv = std::int64_t(0);
	for (auto& r : rows)
		rv = r.get<std::int64_t>(0);
	return rv;
}

std::unique_ptr<std::string> first_key(Sqlite3::Result& rows) {
	for (auto& r : rows)
		return Util::make_unique<std::string>(r.get<std::string>(0));
	return nullptr;
}

}

namespace Ledger { namespace Inventory {

IngestResult ingest(Sqlite3::Tx& tx, std::string const& key) {
	tx.query(R"QRY(
	INSERT OR IGNORE INTO keys (key_val) VALUES (:key);
	)QRY")
		.bind(":key", key)
		.execute()
		;
	return tx.changes() == 0 ? Ingest_AlreadyPresent : Ingest_Inserted;
}

std::int64_t count_unclaimed(Sqlite3::Tx& tx) {
	return single_count(tx, R"QRY(
	SELECT COUNT(*) FROM keys WHERE claimed = 0;
	)QRY");
}
std::int64_t count_all(Sqlite3::Tx& tx) {
	return single_count(tx, "SELECT COUNT(*) FROM keys;");
}

std::unique_ptr<std::string>
select_unclaimed_excluding(Sqlite3::Tx& tx, UserId user) {
	auto rows = tx.query(R"QRY(
	SELECT key_val FROM keys
	 WHERE claimed = 0
	   AND NOT EXISTS (
	       SELECT 1 FROM keys held
	         JOIN giveaway_rounds r ON r.round_id = held.claim_round
	        WHERE held.claimed = 1
	          AND held.user_claim = :user
	          AND r.status = 'active'
	       )
	 LIMIT 1;
	)QRY")
		.bind(":user", user)
		.execute()
		;
	return first_key(rows);
}

std::unique_ptr<std::string>
select_unclaimed(Sqlite3::Tx& tx) {
	auto rows = tx.query(R"QRY(
	SELECT key_val FROM keys WHERE claimed = 0 LIMIT 1;
	)QRY").execute();
	return first_key(rows);
}

void bind( Sqlite3::Tx& tx
	 , std::string const& key
	 , UserId user
	 , ActiveRound const& round
	 ) {
	auto q = tx.query(R"QRY(
	UPDATE keys
	   SET claimed = 1
	     , user_claim = :user
	     , claimed_at = datetime('now', 'localtime')
	     , claim_round = :round
	 WHERE key_val = :key
	   AND claimed = 0;
	)QRY");
	q.bind(":user", user);
	q.bind(":key", key);
	if (round.exists)
		q.bind(":round", round.number);
	else
		q.bind(":round", nullptr);
	q.execute();
	if (tx.changes() != 1)
		throw Ledger::InvariantViolation(
			"key '" + key + "' was not claimable at bind"
		);
}

}}
