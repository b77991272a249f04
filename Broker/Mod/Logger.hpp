#ifndef BROKER_MOD_LOGGER_HPP
#define BROKER_MOD_LOGGER_HPP

#include"Broker/log.hpp"
#include<ostream>

namespace S { class Bus; }

namespace Broker { namespace Mod {

/** class Broker::Mod::Logger
 *
 * @brief prints `Broker::Msg::Log` messages at or
 * above a threshold as
 * `keybroker: <LEVEL> <message>` lines.
 */
class Logger {
private:
	std::ostream& cerr;
	LogLevel threshold;

public:
	Logger() =delete;
	Logger(Logger const&) =delete;

	Logger( std::ostream& cerr
	      , S::Bus& bus
	      , LogLevel threshold
	      );
};

}}

#endif /* !defined(BROKER_MOD_LOGGER_HPP) */
