#ifndef LEDGER_STORE_HPP
#define LEDGER_STORE_HPP

#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Tx.hpp"
#include<cstddef>
#include<functional>
#include<string>

namespace Ledger {

/** class Ledger::Store
 *
 * @brief the single authoritative database, plus
 * the bound on how many ledger operations may be in
 * flight at once.
 *
 * @desc Every ledger operation goes through
 * `transact`, which waits for one of `pool_size`
 * slots, then for the database's transaction, and
 * runs `body` inside a `BEGIN IMMEDIATE`
 * transaction.
 * `body` must call `tx.commit()` for its writes to
 * persist; if it throws, or returns without
 * committing, everything it did is rolled back.
 * Exceptions from `body` or from the database
 * propagate out of the returned action.
 */
class Store {
private:
	Sqlite3::Db db;
	Ev::Semaphore pool;
	std::size_t size;

public:
	Store() =delete;
	Store(Store const&) =delete;

	/* Throws `Sqlite3::Error` if the database cannot
	 * be opened.  */
	Store( std::string const& filename
	     , std::size_t pool_size
	     , int busy_timeout_ms = 5000
	     );

	template<typename a>
	Ev::Io<a> transact(std::function<a(Sqlite3::Tx&)> body) {
		auto act = db.transact().then([body](Sqlite3::Tx tx) {
			return Ev::lift(body(tx));
		});
		return pool.run(std::move(act));
	}

	std::size_t pool_size() const { return size; }
	/* Operations currently waiting for a slot.  */
	std::size_t pending() const { return pool.waiting(); }
};

}

#endif /* !defined(LEDGER_STORE_HPP) */
