#ifndef BROKER_MOD_CONFIGSTORE_HPP
#define BROKER_MOD_CONFIGSTORE_HPP

#include"Ledger/Error.hpp"
#include"Ledger/Settings.hpp"
#include"Util/Either.hpp"
#include<cstddef>
#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Ledger { class Store; }
namespace S { class Bus; }

namespace Broker { namespace Mod {

/** class Broker::Mod::ConfigStore
 *
 * @brief the settings overrides stored in the
 * `config` table, mirrored in memory.
 *
 * @desc The mirror is loaded once by `load()` at
 * startup and afterwards only changed after a write
 * to the database succeeded.
 * All access to the mirror is under one mutex,
 * never held across a database operation, so the
 * accessors may be called from any thread.
 *
 * One instance is created at startup and handed by
 * reference to the modules that need it.
 */
class ConfigStore {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	ConfigStore() =delete;
	ConfigStore(ConfigStore const&) =delete;

	ConfigStore( S::Bus& bus
		   , Ledger::Store& store
		   , Ledger::Settings defaults
		   );
	~ConfigStore();

	/* Replaces the mirror with the database contents.
	 * Stored values that do not parse are logged and
	 * left out.  Returns the number of entries kept.  */
	Ev::Io<Util::Either<Ledger::Error, std::size_t>> load();

	/* The stored override for `key`, or null if none.  */
	std::unique_ptr<std::string> get(std::string const& key) const;

	/** Broker::Mod::ConfigStore::set
	 *
	 * @brief validates, persists, then mirrors one
	 * override.
	 *
	 * @desc Returns the value as stored, in canonical
	 * form.
	 * `Error_InvalidSetting` if the key is unknown or
	 * the value is not valid for it.
	 * If the write fails the mirror is unchanged.
	 */
	Ev::Io<Util::Either<Ledger::Error, std::string>>
	set(std::string const& key, std::string const& value);

	/* Updates only the mirror, for a value the caller
	 * already committed in its own transaction.  */
	void refresh(std::string const& key, std::string const& value);

	/* Defaults overlaid with the mirrored overrides.  */
	Ledger::Settings settings() const;
};

}}

#endif /* !defined(BROKER_MOD_CONFIGSTORE_HPP) */
