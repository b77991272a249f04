#ifndef SQLITE3_QUERY_HPP
#define SQLITE3_QUERY_HPP

#include"Sqlite3/Db.hpp"
#include"Sqlite3/Detail/binds.hpp"
#include<string>
#include<utility>

namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Query
 *
 * @brief a prepared statement, obtained from
 * `Sqlite3::Tx::query`, that owns its statement
 * handle until `execute` hands it to a `Result`.
 *
 * @desc Parameters are named (`:name`).
 * Parameters never bound are NULL.
 */
class Query {
private:
	Sqlite3::Db db;
	void* stmt;

	friend class Sqlite3::Tx;
	Query(Sqlite3::Db const& db_, void* stmt_) : db(db_), stmt(stmt_) { }

	/* Throws `Sqlite3::Error` (SQLITE_RANGE) for a
	 * name the statement does not have.  */
	int parameter(char const* name) const;

public:
	Query() =delete;
	Query(Query const&) =delete;
	Query(Query&& o) : db(std::move(o.db)), stmt(o.stmt) {
		o.stmt = nullptr;
	}
	~Query();

	template<typename a>
	Query& bind(char const* name, a value) {
		Detail::Bind<a>::bind(stmt, parameter(name), std::move(value));
		return *this;
	}

	/** Sqlite3::Query::execute
	 *
	 * @brief steps the statement to its first row,
	 * consuming this query.
	 *
	 * @desc Throws `Sqlite3::Error` if that step
	 * fails, e.g. on a constraint violation.
	 */
	Result execute();
};

}

#endif /* !defined(SQLITE3_QUERY_HPP) */
