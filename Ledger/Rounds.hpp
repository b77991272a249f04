#ifndef LEDGER_ROUNDS_HPP
#define LEDGER_ROUNDS_HPP

#include<cstdint>

namespace Sqlite3 { class Tx; }

namespace Ledger {

typedef std::int64_t RoundNumber;

/** struct Ledger::ActiveRound
 *
 * @brief the round currently accepting claims, if
 * any.  `number` is meaningless unless `exists`.
 */
struct ActiveRound {
	bool exists;
	RoundNumber number;

	static ActiveRound none() { return ActiveRound{false, 0}; }
	static ActiveRound of(RoundNumber n) { return ActiveRound{true, n}; }

	bool operator==(ActiveRound const& o) const {
		return exists == o.exists && (!exists || number == o.number);
	}
	bool operator!=(ActiveRound const& o) const {
		return !(*this == o);
	}
};

namespace Rounds {

ActiveRound get_active(Sqlite3::Tx& tx);

/* Highest round number ever opened, 0 if none.  */
RoundNumber highest(Sqlite3::Tx& tx);

/* Number of rows whose status is `active`.  */
std::int64_t count_active(Sqlite3::Tx& tx);

/** Ledger::Rounds::open
 *
 * @brief completes whatever round is active, then
 * makes `n` the active round.
 *
 * @desc An existing row for `n` is reactivated in
 * place, so keys already claimed in round `n` keep
 * referring to it.
 * Both steps run in the caller's transaction and
 * must be committed together.
 */
void open(Sqlite3::Tx& tx, RoundNumber n);

}}

#endif /* !defined(LEDGER_ROUNDS_HPP) */
