#ifndef SQLITE3_DETAIL_BINDS_HPP
#define SQLITE3_DETAIL_BINDS_HPP

#include<cstddef>
#include<cstdint>
#include<string>
#include<type_traits>

namespace Sqlite3 { namespace Detail {

void bind_d(void* stmt, int l, double);
void bind_i(void* stmt, int l, std::int64_t);
void bind_s(void* stmt, int l, std::string const&);
void bind_null(void* stmt, int l);

template<typename a, typename enable = void>
struct Bind;

/* All integer types, bool included, are stored as
 * INTEGER.  */
template<typename a>
struct Bind<a, typename std::enable_if<std::is_integral<a>::value>::type> {
	static void bind(void* stmt, int l, a v) {
		bind_i(stmt, l, std::int64_t(v));
	}
};
template<typename a>
struct Bind<a, typename std::enable_if<std::is_floating_point<a>::value>::type> {
	static void bind(void* stmt, int l, a v) {
		bind_d(stmt, l, double(v));
	}
};
template<>
struct Bind<char const*> {
	static void bind(void* stmt, int l, char const* v) {
		bind_s(stmt, l, v);
	}
};
template<>
struct Bind<std::string> {
	static void bind(void* stmt, int l, std::string const& v) {
		bind_s(stmt, l, v);
	}
};
template<>
struct Bind<std::nullptr_t> {
	static void bind(void* stmt, int l, std::nullptr_t) {
		bind_null(stmt, l);
	}
};

}}

#endif /* !defined(SQLITE3_DETAIL_BINDS_HPP) */
