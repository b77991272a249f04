#ifndef BROKER_MSG_LOG_HPP
#define BROKER_MSG_LOG_HPP

#include"Broker/log.hpp"
#include<string>

namespace Broker { namespace Msg {

/** struct Broker::Msg::Log
 *
 * @brief a formatted log line; raised by
 * `Broker::log`, printed by `Broker::Mod::Logger`.
 */
struct Log {
	LogLevel level;
	std::string message;
};

}}

#endif /* !defined(BROKER_MSG_LOG_HPP) */
