#ifndef SQLITE3_TX_HPP
#define SQLITE3_TX_HPP

#include<cstdint>
#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Query; }

namespace Sqlite3 {

/** class Sqlite3::Tx
 *
 * @brief an open `BEGIN IMMEDIATE` transaction.
 *
 * @desc Movable, not copyable.
 * Nothing is written unless `commit()` succeeds:
 * destroying a still-valid transaction rolls it
 * back, which is how an exception thrown halfway
 * through a sequence of statements discards the
 * statements already run.
 *
 * `commit()` leaves this object invalid.
 * If COMMIT fails the transaction is rolled back
 * and `Sqlite3::Error` is thrown.
 *
 * Only `Sqlite3::Db::transact` creates valid
 * transactions.
 */
class Tx {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Db;

	explicit
	Tx(Sqlite3::Db const&);

public:
	Tx();
	Tx(Tx&&);
	~Tx();

	Tx& operator=(Tx&&);

	explicit operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Sqlite3::Query query(char const*);
	Sqlite3::Query query(std::string const&);

	/** Sqlite3::Tx::query_execute
	 *
	 * @brief runs one or more statements with no
	 * parameters and no results, e.g. DDL.
	 */
	void query_execute(char const*);
	void query_execute(std::string const& q) {
		query_execute(q.c_str());
	}

	/* Rows modified by the most recent INSERT, UPDATE
	 * or DELETE.  */
	std::int64_t changes() const;

	void commit();
};

}

#endif /* !defined(SQLITE3_TX_HPP) */
