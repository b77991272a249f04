#ifndef LEDGER_SCHEMA_HPP
#define LEDGER_SCHEMA_HPP

namespace Sqlite3 { class Tx; }

namespace Ledger { namespace Schema {

/** Ledger::Schema::create
 *
 * @brief creates the `keys`, `users`,
 * `giveaway_rounds` and `config` tables if absent,
 * and upgrades a `keys` table from before rounds
 * existed by adding its `claim_round` column.
 *
 * @desc Returns true if such an upgrade was made.
 * Does not commit.
 */
bool create(Sqlite3::Tx& tx);

}}

#endif /* !defined(LEDGER_SCHEMA_HPP) */
