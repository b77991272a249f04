#ifndef LEDGER_INVENTORY_HPP
#define LEDGER_INVENTORY_HPP

#include"Ledger/Rounds.hpp"
#include"Ledger/Users.hpp"
#include<cstdint>
#include<memory>
#include<string>

namespace Sqlite3 { class Tx; }

namespace Ledger {

enum IngestResult {
	Ingest_Inserted,
	Ingest_AlreadyPresent
};

namespace Inventory {

/* Adds the key unclaimed unless it is already known.  */
IngestResult ingest(Sqlite3::Tx& tx, std::string const& key);

std::int64_t count_unclaimed(Sqlite3::Tx& tx);
std::int64_t count_all(Sqlite3::Tx& tx);

/** Ledger::Inventory::select_unclaimed_excluding
 *
 * @brief picks an unclaimed key for `user`, or
 * returns null if the user already holds a key
 * claimed in whatever round is active right now, or
 * if no key is left.
 *
 * @desc The exclusion looks at the status of the
 * round recorded on the user's keys rather than at
 * a round number remembered elsewhere, so it is
 * correct even if the active round changed since
 * the caller last looked.
 */
std::unique_ptr<std::string>
select_unclaimed_excluding(Sqlite3::Tx& tx, UserId user);

/* Picks any unclaimed key, or null if none is left.  */
std::unique_ptr<std::string>
select_unclaimed(Sqlite3::Tx& tx);

/** Ledger::Inventory::bind
 *
 * @brief marks `key` claimed by `user` in `round`
 * (NULL round if none is active), stamped with the
 * local time.
 *
 * @desc Throws `Ledger::InvariantViolation` unless
 * exactly one unclaimed row matched; the key must
 * have been selected in the same transaction.
 */
void bind( Sqlite3::Tx& tx
	 , std::string const& key
	 , UserId user
	 , ActiveRound const& round
	 );

}}

#endif /* !defined(LEDGER_INVENTORY_HPP) */
