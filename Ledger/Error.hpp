#ifndef LEDGER_ERROR_HPP
#define LEDGER_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<ostream>
#include<stdexcept>
#include<string>

namespace Sqlite3 { class Error; }

namespace Ledger {

/** enum Ledger::Error
 *
 * @brief why a ledger operation did not succeed.
 *
 * @desc `Error_AlreadyClaimedThisRound` and
 * `Error_PoolExhausted` are ordinary outcomes.
 * `Error_TransactionFailed` and
 * `Error_StorageUnavailable` mean nothing was
 * written and the whole operation can be retried.
 */
enum Error {
	/* The caller should not have asked (e.g. no user name).  */
	Error_Ineligible,
	Error_AlreadyClaimedThisRound,
	Error_PoolExhausted,
	Error_TransactionFailed,
	Error_StorageUnavailable,
	/* A guarded write touched the wrong number of rows.  */
	Error_InvariantViolation,
	Error_RoundRejected,
	Error_InvalidSetting
};

/* Lowercase hyphenated name, e.g. "pool-exhausted".  */
char const* error_reason(Error e);

std::ostream& operator<<(std::ostream&, Error);

/** Ledger::classify
 *
 * @brief maps a storage failure to either
 * `Error_StorageUnavailable` (the file cannot be
 * opened, read or written) or
 * `Error_TransactionFailed` (anything else: busy,
 * constraint, generic error).
 */
Error classify(Sqlite3::Error const&);

/** class Ledger::InvariantViolation
 *
 * @brief thrown inside a transaction when a write
 * that must touch exactly one row did not.
 * Propagating it rolls the transaction back.
 */
class InvariantViolation
	: public Util::BacktraceException<std::logic_error> {
public:
	explicit
	InvariantViolation(std::string const& msg)
		: Util::BacktraceException<std::logic_error>(
			"Ledger: invariant violated: " + msg
		  ) { }
};

}

#endif /* !defined(LEDGER_ERROR_HPP) */
