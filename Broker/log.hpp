#ifndef BROKER_LOG_HPP
#define BROKER_LOG_HPP

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Broker {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/* Lowercase name of the level, e.g. "warn".  */
char const* log_level_name(LogLevel l);

/** Broker::log
 *
 * @brief formats the message printf-style right
 * away and raises it as a `Broker::Msg::Log`.
 */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
#if defined(__GNUC__)
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* BROKER_LOG_HPP */
