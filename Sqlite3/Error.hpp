#ifndef SQLITE3_ERROR_HPP
#define SQLITE3_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Sqlite3 {

/** class Sqlite3::Error
 *
 * @brief thrown by every failing database call.
 *
 * @desc Carries the SQLITE3 extended result code so
 * that callers can tell contention (`SQLITE_BUSY`,
 * constraint violations) from the database being
 * unusable (`SQLITE_CANTOPEN`, `SQLITE_IOERR`, ...).
 */
class Error : public Util::BacktraceException<std::runtime_error> {
private:
	int ext_code;

public:
	Error(int ext_code_, std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg)
		, ext_code(ext_code_)
		{ }

	/* The extended result code.  */
	int code() const { return ext_code; }
	/* The primary result code, i.e. the low byte.  */
	int primary() const { return ext_code & 0xFF; }
};

}

#endif /* !defined(SQLITE3_ERROR_HPP) */
