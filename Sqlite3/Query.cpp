#include"Sqlite3/Error.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Result.hpp"
#include<sqlite3.h>

namespace Sqlite3 {

Query::~Query() {
	if (stmt)
		(void) sqlite3_finalize((sqlite3_stmt*) stmt);
}

int Query::parameter(char const* name) const {
	auto index = sqlite3_bind_parameter_index((sqlite3_stmt*) stmt, name);
	if (index == 0)
		throw Sqlite3::Error( SQLITE_RANGE
				    , std::string("Sqlite3::Query: no parameter ")
				    + name
				    );
	return index;
}

Result Query::execute() {
	auto owned = stmt;
	stmt = nullptr;
	return Result(db, owned);
}

}
