#ifndef UTIL_BACKTRACEEXCEPTION_HPP
#define UTIL_BACKTRACEEXCEPTION_HPP

#include<utility>

#if !KEYBROKER_EXCEPTION_BACKTRACE

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief passes straight through to E when
 * backtraces are not compiled in.
 */
template<typename E>
class BacktraceException : public E {
public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: E(std::forward<Args>(args)...) { }
};

}

#else /* KEYBROKER_EXCEPTION_BACKTRACE */

#include<cstddef>
#include<exception>
#include<execinfo.h>
#include<sstream>
#include<stdlib.h>
#include<string>
#include<vector>

#define UNW_LOCAL_ONLY
#include<libunwind.h>

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief wraps E and records the call stack at
 * construction.
 *
 * @desc Symbolization is deferred to the first
 * `what()` call, so exceptions that are caught
 * and handled cost only the unwind.
 */
template<typename E>
class BacktraceException : public E {
public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: E(std::forward<Args>(args)...)
		, formatted(false)
		{ capture(); }

	char const* what() const noexcept override {
		if (!formatted) {
			formatted = true;
			try {
				message = std::string(E::what())
					+ "\nBacktrace:\n"
					+ format();
			} catch (std::exception const&) {
				return E::what();
			}
		}
		return message.c_str();
	}

private:
	static constexpr std::size_t max_frames = 64;
	mutable bool formatted;
	mutable std::string message;
	std::vector<void*> frames;

	void capture() {
		unw_cursor_t cursor;
		unw_context_t context;
		unw_getcontext(&context);
		unw_init_local(&cursor, &context);
		while (unw_step(&cursor) > 0 && frames.size() < max_frames) {
			unw_word_t ip;
			unw_get_reg(&cursor, UNW_REG_IP, &ip);
			frames.push_back(reinterpret_cast<void*>(ip));
		}
	}
	std::string format() const {
		auto symbols = backtrace_symbols(frames.data(), int(frames.size()));
		auto os = std::ostringstream();
		for (auto i = std::size_t(0); i < frames.size(); ++i) {
			os << "#" << i << " ";
			if (symbols)
				os << symbols[i];
			else
				os << frames[i];
			os << "\n";
		}
		free(symbols);
		return os.str();
	}
};

}

#endif /* KEYBROKER_EXCEPTION_BACKTRACE */

#endif /* !defined(UTIL_BACKTRACEEXCEPTION_HPP) */
