#include"Util/Str.hpp"
#include<algorithm>
#include<cctype>
#include<cerrno>
#include<cstdlib>
#include<stdio.h>

namespace {

bool is_space(char c) {
	return std::isspace((unsigned char) c);
}

}

namespace Util {
namespace Str {

std::string trim(std::string const& s) {
	auto start = std::find_if_not(s.begin(), s.end(), is_space);
	if (start == s.end())
		return "";
	auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
	return std::string(start, end);
}

std::vector<std::string> words(std::string const& s) {
	auto rv = std::vector<std::string>();
	auto it = s.begin();
	for (;;) {
		it = std::find_if_not(it, s.end(), is_space);
		if (it == s.end())
			break;
		auto end = std::find_if(it, s.end(), is_space);
		rv.emplace_back(it, end);
		it = end;
	}
	return rv;
}

std::string join( std::vector<std::string>::const_iterator b
		, std::vector<std::string>::const_iterator e
		) {
	auto rv = std::string();
	for (auto it = b; it != e; ++it) {
		if (it != b)
			rv += " ";
		rv += *it;
	}
	return rv;
}

bool parse_int(std::string const& s, std::int64_t& out) {
	if (s.empty() || is_space(s[0]))
		return false;
	auto end = (char*) nullptr;
	errno = 0;
	auto v = std::strtoll(s.c_str(), &end, 10);
	if (errno != 0 || *end != '\0')
		return false;
	out = std::int64_t(v);
	return true;
}

std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto rv = vfmt(tpl, ap);
	va_end(ap);
	return rv;
}

std::string vfmt(char const* tpl, va_list ap) {
	va_list ap2;
	va_copy(ap2, ap);
	auto len = vsnprintf(nullptr, 0, tpl, ap2);
	va_end(ap2);
	if (len < 0)
		return std::string(tpl);

	auto buf = std::vector<char>(std::size_t(len) + 1);
	vsnprintf(buf.data(), buf.size(), tpl, ap);
	return std::string(buf.data(), std::size_t(len));
}

}}
