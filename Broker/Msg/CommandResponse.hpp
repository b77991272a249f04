#ifndef BROKER_MSG_COMMANDRESPONSE_HPP
#define BROKER_MSG_COMMANDRESPONSE_HPP

#include<cstdint>
#include<string>

namespace Broker { namespace Msg {

/** struct Broker::Msg::CommandResponse
 *
 * @brief the answer to a command, printed as
 * `ok <command> <details>` or
 * `error <command> <details>`.
 */
struct CommandResponse {
	std::uint64_t id;
	bool ok;
	std::string command;
	/* Result on success, reason on failure.  */
	std::string details;
};

}}

#endif /* !defined(BROKER_MSG_COMMANDRESPONSE_HPP) */
