#ifndef BROKER_MSG_COMMANDREQUEST_HPP
#define BROKER_MSG_COMMANDREQUEST_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Broker { namespace Msg {

/** struct Broker::Msg::CommandRequest
 *
 * @brief one console command line, split into
 * words.
 * Answer with exactly one
 * `Broker::Msg::CommandResponse` carrying the same
 * `id`.
 */
struct CommandRequest {
	std::uint64_t id;
	std::string command;
	std::vector<std::string> args;
};

}}

#endif /* !defined(BROKER_MSG_COMMANDREQUEST_HPP) */
