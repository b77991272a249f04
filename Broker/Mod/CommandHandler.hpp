#ifndef BROKER_MOD_COMMANDHANDLER_HPP
#define BROKER_MOD_COMMANDHANDLER_HPP

#include<memory>

namespace Broker { namespace Mod { class Claimer; }}
namespace Broker { namespace Mod { class ConfigStore; }}
namespace Broker { namespace Mod { class KeyFileWatcher; }}
namespace Broker { namespace Mod { class RoundManager; }}
namespace S { class Bus; }

namespace Broker { namespace Mod {

/** class Broker::Mod::CommandHandler
 *
 * @brief answers `Broker::Msg::CommandRequest`
 * with exactly one `Broker::Msg::CommandResponse`.
 *
 * @desc Commands:
 *
 * - `claim USER` and `grant USER`
 * - `open-round N` and `active-round`
 * - `remaining`
 * - `get KEY` and `set KEY VALUE...`
 * - `ingest`
 * - `help`
 */
class CommandHandler {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	CommandHandler() =delete;
	CommandHandler(CommandHandler const&) =delete;

	CommandHandler( S::Bus& bus
		      , Claimer& claimer
		      , RoundManager& rounds
		      , ConfigStore& config
		      , KeyFileWatcher& watcher
		      );
	~CommandHandler();
};

}}

#endif /* !defined(BROKER_MOD_COMMANDHANDLER_HPP) */
