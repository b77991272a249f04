#ifndef SQLITE3_DETAIL_COLUMNS_HPP
#define SQLITE3_DETAIL_COLUMNS_HPP

#include<cstdint>
#include<string>
#include<type_traits>

namespace Sqlite3 { namespace Detail {

/* Reads column `c` of the current row of `stmt`.
 * NULL reads as zero or the empty string.  */
void fetch(void* stmt, int c, std::int64_t& out);
void fetch(void* stmt, int c, double& out);
void fetch(void* stmt, int c, std::string& out);

bool fetch_null(void* stmt, int c);

/* What SQLITE3 hands back for a requested C++ type:
 * every integral type (bool too) comes from an int64,
 * every floating type from a double.  */
template<typename a>
struct Storage {
	typedef typename std::conditional<
		std::is_integral<a>::value, std::int64_t,
		typename std::conditional<
			std::is_floating_point<a>::value, double, a
		>::type
	>::type type;
};

}}

#endif /* !defined(SQLITE3_DETAIL_COLUMNS_HPP) */
