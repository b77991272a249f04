#ifndef LEDGER_USERS_HPP
#define LEDGER_USERS_HPP

#include<cstdint>
#include<string>

namespace Sqlite3 { class Tx; }

namespace Ledger {

typedef std::int64_t UserId;

namespace Users {

/** Ledger::Users::ensure
 *
 * @brief returns the id of the user with the given
 * external name, creating the user if this is the
 * first time the name is seen.
 *
 * @desc Calling it again for the same name, in the
 * same or another transaction, returns the same id.
 */
UserId ensure(Sqlite3::Tx& tx, std::string const& name);

/* Number of known users.  */
std::int64_t count(Sqlite3::Tx& tx);

}}

#endif /* !defined(LEDGER_USERS_HPP) */
