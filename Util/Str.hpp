#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

/*
 * Minor string utilities.
 */

#include<cstdint>
#include<stdarg.h>
#include<string>
#include<vector>

namespace Util {
namespace Str {

/* Removes leading and trailing whitespace.  */
std::string trim(std::string const& s);

/* Splits on runs of whitespace; never yields empty
 * words.  */
std::vector<std::string> words(std::string const& s);

/* Joins the given words with single spaces.  */
std::string join( std::vector<std::string>::const_iterator b
		, std::vector<std::string>::const_iterator e
		);

/* Parses a complete decimal integer, optionally
 * signed.  Returns false on any stray character or
 * overflow, leaving `out` untouched.  */
bool parse_int(std::string const& s, std::int64_t& out);

/* Like `sprintf`.  */
std::string fmt(char const *tpl, ...)
#if defined(__GNUC__)
	__attribute__ ((format (printf, 1, 2)))
#endif
;
std::string vfmt(char const *tpl, va_list ap);

}}

#endif /* !defined(UTIL_STR_HPP) */
