#ifndef SQLITE3_DB_HPP
#define SQLITE3_DB_HPP

#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Sqlite3 { class Query; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Db
 *
 * @brief shared handle to one SQLITE3 connection.
 *
 * @desc Copies refer to the same connection.
 *
 * The primary member function is `transact`, whose
 * action completes with a `Sqlite3::Tx` once no
 * other transaction on this connection is in
 * flight.
 * Greenthreads waiting for a transaction are served
 * in FIFO order.
 */
class Db {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	friend class Sqlite3::Query;
	friend class Sqlite3::Result;
	friend class Sqlite3::Tx;

	void* get_connection() const;
	void transaction_finish() const;

public:
	/* Opens the database, creating it if absent.
	 * ":memory:" gives a private in-memory database.
	 * Throws `Sqlite3::Error` if the file cannot be
	 * opened or configured.
	 */
	explicit
	Db(std::string const& filename, int busy_timeout_ms = 5000);

	/* An invalid handle; transact() must not be
	 * called on it.  */
	Db() =default;
	Db(Db const&) =default;
	Db(Db&&) =default;
	Db& operator=(Db const&) =default;
	Db& operator=(Db&&) =default;
	~Db() =default;

	explicit operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	/** Sqlite3::Db::transact
	 *
	 * @desc Waits until the connection is free, then
	 * issues `BEGIN IMMEDIATE`.
	 * The action throws `Sqlite3::Error` if BEGIN
	 * fails; the next waiter is served regardless.
	 */
	Ev::Io<Sqlite3::Tx> transact();

	/* Number of greenthreads waiting in transact().  */
	std::size_t waiting() const;
};

}

#endif /* !defined(SQLITE3_DB_HPP) */
