#ifndef BROKER_MSG_INIT_HPP
#define BROKER_MSG_INIT_HPP

#include<string>

namespace Broker { namespace Msg {

/** struct Broker::Msg::Init
 *
 * @brief raised once the database is open, before
 * anything else touches it.
 *
 * @desc The raise throws if initialization failed,
 * in which case the process exits.
 */
struct Init {
	std::string db_path;
};

}}

#endif /* !defined(BROKER_MSG_INIT_HPP) */
