#include"Sqlite3/Detail/columns.hpp"
#include<sqlite3.h>

namespace {

sqlite3_stmt* as_stmt(void* stmt) {
	return static_cast<sqlite3_stmt*>(stmt);
}

}

namespace Sqlite3 { namespace Detail {

void fetch(void* stmt, int c, std::int64_t& out) {
	out = sqlite3_column_int64(as_stmt(stmt), c);
}
void fetch(void* stmt, int c, double& out) {
	out = sqlite3_column_double(as_stmt(stmt), c);
}
void fetch(void* stmt, int c, std::string& out) {
	/* Length is only valid after the text conversion.  */
	auto text = sqlite3_column_text(as_stmt(stmt), c);
	auto size = sqlite3_column_bytes(as_stmt(stmt), c);
	if (text)
		out.assign(reinterpret_cast<char const*>(text), std::size_t(size));
	else
		out.clear();
}

bool fetch_null(void* stmt, int c) {
	return sqlite3_column_type(as_stmt(stmt), c) == SQLITE_NULL;
}

}}
