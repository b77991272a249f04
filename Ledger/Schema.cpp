#include"Ledger/Schema.hpp"
#include"Sqlite3.hpp"

namespace {

bool has_column(Sqlite3::Tx& tx, char const* table, char const* column) {
	auto found = false;
	auto rows = tx.query(std::string("PRAGMA table_info(") + table + ");")
		.execute()
		;
	for (auto& r : rows) {
		/* cid, name, type, notnull, dflt_value, pk */
		if (r.get<std::string>(1) == column)
			found = true;
	}
	return found;
}

}

namespace Ledger { namespace Schema {

bool create(Sqlite3::Tx& tx) {
	tx.query_execute(R"QRY(
	CREATE TABLE IF NOT EXISTS users
	     ( id INTEGER PRIMARY KEY AUTOINCREMENT NOT NULL
	     , username VARCHAR(255) NOT NULL
	     , UNIQUE (username)
	     );
	CREATE TABLE IF NOT EXISTS giveaway_rounds
	     ( round_id INTEGER PRIMARY KEY NOT NULL
	     , status VARCHAR(255) NOT NULL
	     );
	CREATE TABLE IF NOT EXISTS keys
	     ( id INTEGER PRIMARY KEY AUTOINCREMENT NOT NULL
	     , key_val VARCHAR(255) NOT NULL
	     , claimed BOOLEAN DEFAULT FALSE NOT NULL
	     , user_claim INTEGER
	     , claimed_at DATE
	     , added_at DATE DEFAULT (datetime('now', 'localtime'))
	     , claim_round INTEGER
	     , UNIQUE (key_val)
	     , FOREIGN KEY (user_claim) REFERENCES users (id)
	     , FOREIGN KEY (claim_round) REFERENCES giveaway_rounds (round_id)
	     );
	CREATE TABLE IF NOT EXISTS config
	     ( key VARCHAR(255) PRIMARY KEY NOT NULL
	     , value VARCHAR(255) NOT NULL
	     );
	)QRY");

	auto upgraded = false;
	if (!has_column(tx, "keys", "claim_round")) {
		tx.query_execute(R"QRY(
		ALTER TABLE keys
		  ADD COLUMN claim_round INTEGER
		  REFERENCES giveaway_rounds (round_id);
		)QRY");
		upgraded = true;
	}

	/* At most one active round, enforced by the
	 * database itself.  */
	tx.query_execute(R"QRY(
	CREATE UNIQUE INDEX IF NOT EXISTS "giveaway_rounds_one_active"
	    ON giveaway_rounds (status)
	 WHERE status = 'active';
	CREATE INDEX IF NOT EXISTS "keys_by_claimant"
	    ON keys (user_claim, claim_round);
	CREATE INDEX IF NOT EXISTS "keys_by_claimed"
	    ON keys (claimed);
	)QRY");

	return upgraded;
}

}}
