#ifndef BROKER_MOD_KEYFILEWATCHER_HPP
#define BROKER_MOD_KEYFILEWATCHER_HPP

#include"Ledger/Error.hpp"
#include"Util/Either.hpp"
#include<cstddef>
#include<memory>
#include<string>
#include<vector>

namespace Broker { namespace Mod { class Ingestor; }}
namespace Broker { namespace Mod { class Waiter; }}
namespace Ev { template<typename a> class Io; }
namespace Ev { class ThreadPool; }
namespace S { class Bus; }

namespace Broker { namespace Mod {

/** class Broker::Mod::KeyFileWatcher
 *
 * @brief periodically feeds the key source file to
 * the `Ingestor`.
 *
 * @desc Starts on `Broker::Msg::Begin` with one pass
 * right away, then one pass every `interval`
 * seconds until shutdown.  An interval of 0 turns
 * the periodic passes off; `pass()` still works.
 */
class KeyFileWatcher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	KeyFileWatcher() =delete;
	KeyFileWatcher(KeyFileWatcher const&) =delete;

	KeyFileWatcher( S::Bus& bus
		      , Ev::ThreadPool& threadpool
		      , Waiter& waiter
		      , Ingestor& ingestor
		      , std::string path
		      , double interval
		      );
	~KeyFileWatcher();

	/** Broker::Mod::KeyFileWatcher::pass
	 *
	 * @brief reads the file once and syncs its keys;
	 * returns how many were new.
	 *
	 * @desc A missing or unreadable file is logged and
	 * counts as no new keys.
	 */
	Ev::Io<Util::Either<Ledger::Error, std::size_t>> pass();

	/* Trimmed, non-blank lines of the given text.  */
	static std::vector<std::string> parse(std::string const& text);
};

}}

#endif /* !defined(BROKER_MOD_KEYFILEWATCHER_HPP) */
