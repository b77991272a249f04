#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Result.hpp"
#include<sqlite3.h>
#include<string>

namespace {

void finalize(void*& stmt) {
	if (!stmt)
		return;
	sqlite3_finalize(static_cast<sqlite3_stmt*>(stmt));
	stmt = nullptr;
}

}

namespace Sqlite3 {

Result::Result(Sqlite3::Db const& db_, void* stmt_)
	: db(db_), stmt(stmt_) {
	try {
		step();
	} catch (Sqlite3::Error const&) {
		finalize(stmt);
		throw;
	}
}
Result::Result(Result&& o) : db(std::move(o.db)), stmt(o.stmt) {
	o.stmt = nullptr;
}
Result::~Result() {
	finalize(stmt);
}

void Result::step() {
	switch (sqlite3_step(static_cast<sqlite3_stmt*>(stmt))) {
	case SQLITE_ROW:
		return;
	case SQLITE_DONE:
		finalize(stmt);
		return;
	}
	auto conn = static_cast<sqlite3*>(db.get_connection());
	auto code = sqlite3_extended_errcode(conn);
	auto msg = std::string(sqlite3_errmsg(conn));
	throw Sqlite3::Error(code, "Sqlite3::Result: " + msg);
}

}
