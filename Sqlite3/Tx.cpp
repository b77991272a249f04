#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/make_unique.hpp"
#include<sqlite3.h>

namespace Sqlite3 {

class Tx::Impl {
private:
	Sqlite3::Db db;
	bool open;

	sqlite3* connection() const {
		return (sqlite3*) db.get_connection();
	}
	void throw_sqlite3(int res, char const* src) {
		throw Sqlite3::Error(
			res, std::string("Sqlite3::Tx: ") + src + ": "
			   + sqlite3_errmsg(connection())
		);
	}

public:
	explicit
	Impl(Sqlite3::Db const& db_) : db(db_), open(false) {
		auto res = sqlite3_exec( connection(), "BEGIN IMMEDIATE"
				       , nullptr, nullptr, nullptr
				       );
		if (res != SQLITE_OK)
			throw_sqlite3(res, "BEGIN IMMEDIATE");
		open = true;
	}
	~Impl() {
		if (!open)
			return;
		(void) sqlite3_exec( connection(), "ROLLBACK"
				   , nullptr, nullptr, nullptr
				   );
		open = false;
		db.transaction_finish();
	}

	void commit() {
		auto res = sqlite3_exec( connection(), "COMMIT"
				       , nullptr, nullptr, nullptr
				       );
		if (res != SQLITE_OK) {
			auto msg = std::string(sqlite3_errmsg(connection()));
			(void) sqlite3_exec( connection(), "ROLLBACK"
					   , nullptr, nullptr, nullptr
					   );
			open = false;
			db.transaction_finish();
			throw Sqlite3::Error(
				res, std::string("Sqlite3::Tx: COMMIT: ") + msg
			);
		}
		open = false;
		db.transaction_finish();
	}

	void query_execute(char const* q) {
		auto res = sqlite3_exec(connection(), q, nullptr, nullptr, nullptr);
		if (res != SQLITE_OK)
			throw_sqlite3(res, q);
	}

	Query query(char const* sql) {
		auto stmt = (sqlite3_stmt*) nullptr;
		auto res = sqlite3_prepare_v2( connection(), sql, -1
					     , &stmt, nullptr
					     );
		if (res != SQLITE_OK)
			throw_sqlite3(res, sql);
		return Query(db, stmt);
	}

	std::int64_t changes() const {
		return sqlite3_changes(connection());
	}
};

Tx::Tx(Sqlite3::Db const& db) : pimpl(Util::make_unique<Impl>(db)) { }
Tx::Tx() : pimpl(nullptr) { }
Tx::Tx(Tx&& o) : pimpl(std::move(o.pimpl)) { }
Tx::~Tx() { }

Tx& Tx::operator=(Tx&& o) {
	auto tmp = std::move(o);
	std::swap(pimpl, tmp.pimpl);
	return *this;
}

void Tx::commit() {
	auto my_pimpl = std::move(pimpl);
	my_pimpl->commit();
}
Query Tx::query(char const* sql) {
	return pimpl->query(sql);
}
Query Tx::query(std::string const& sql) {
	return pimpl->query(sql.c_str());
}
void Tx::query_execute(char const* q) {
	pimpl->query_execute(q);
}
std::int64_t Tx::changes() const {
	return pimpl->changes();
}

}
