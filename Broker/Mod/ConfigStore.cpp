#include"Broker/Mod/ConfigStore.hpp"
#include"Broker/ledger_call.hpp"
#include"Broker/log.hpp"
#include"Ev/Io.hpp"
#include"Ledger/Config.hpp"
#include"Ledger/Store.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/make_unique.hpp"
#include<map>
#include<mutex>

namespace Broker { namespace Mod {

class ConfigStore::Impl {
private:
	S::Bus& bus;
	Ledger::Store& store;
	Ledger::Settings const defaults;

	mutable std::mutex mtx;
	std::map<std::string, std::string> cache;

	typedef std::map<std::string, std::string> Entries;

public:
	Impl( S::Bus& bus_
	    , Ledger::Store& store_
	    , Ledger::Settings defaults_
	    ) : bus(bus_)
	      , store(store_)
	      , defaults(std::move(defaults_))
	      { }

	Ev::Io<Util::Either<Ledger::Error, std::size_t>> load() {
		typedef Util::Either<Ledger::Error, Entries> R;
		auto act = store.transact<R>([](Sqlite3::Tx& tx) {
			auto entries = Ledger::Config::load(tx);
			tx.commit();
			return R::right(std::move(entries));
		});
		return ledger_call(bus, "ConfigStore", act).then([this](R r) {
			typedef Util::Either<Ledger::Error, std::size_t> Out;
			if (r.is_left())
				return Ev::lift(Out::left(r.left()));
			auto entries = r.right();

			/* Unusable values stay out of the cache, so
			 * get() agrees with settings().  */
			auto trial = defaults;
			auto act = Ev::lift();
			for (auto const& k : trial.overlay(entries)) {
				act += Broker::log( bus, Warn
						  , "ConfigStore: ignoring stored "
						    "%s = '%s'"
						  , k.c_str()
						  , entries[k].c_str()
						  );
				entries.erase(k);
			}
			{
				std::lock_guard<std::mutex> lock(mtx);
				cache = entries;
			}

			act += Broker::log( bus, Info
					  , "ConfigStore: %zu settings loaded."
					  , entries.size()
					  );
			return act.then([entries]() {
				return Ev::lift(Out::right(entries.size()));
			});
		});
	}

	std::unique_ptr<std::string> get(std::string const& key) const {
		std::lock_guard<std::mutex> lock(mtx);
		auto it = cache.find(key);
		if (it == cache.end())
			return nullptr;
		return Util::make_unique<std::string>(it->second);
	}

	Ev::Io<Util::Either<Ledger::Error, std::string>>
	set(std::string const& key, std::string const& value) {
		typedef Util::Either<Ledger::Error, std::string> R;

		auto trial = Ledger::Settings();
		if (!trial.apply(key, value))
			return Broker::log( bus, Debug
					  , "ConfigStore: refused %s = '%s'"
					  , key.c_str(), value.c_str()
					  ).then([]() {
				return Ev::lift(R::left(Ledger::Error_InvalidSetting));
			});
		auto canonical = trial.get(key);

		auto act = store.transact<R>([key, canonical](Sqlite3::Tx& tx) {
			Ledger::Config::put(tx, key, canonical);
			tx.commit();
			return R::right(canonical);
		});
		return ledger_call(bus, "ConfigStore", act).then([this, key](R r) {
			if (r.is_left())
				return Ev::lift(r);
			refresh(key, r.right());
			return Broker::log( bus, Info
					  , "ConfigStore: %s set to '%s'."
					  , key.c_str(), r.right().c_str()
					  ).then([r]() {
				return Ev::lift(r);
			});
		});
	}

	void refresh(std::string const& key, std::string const& value) {
		std::lock_guard<std::mutex> lock(mtx);
		cache[key] = value;
	}

	Ledger::Settings settings() const {
		auto entries = Entries();
		{
			std::lock_guard<std::mutex> lock(mtx);
			entries = cache;
		}
		auto rv = defaults;
		(void) rv.overlay(entries);
		return rv;
	}
};

ConfigStore::ConfigStore( S::Bus& bus
			, Ledger::Store& store
			, Ledger::Settings defaults
			) : pimpl(Util::make_unique<Impl>( bus, store
							 , std::move(defaults)
							 ))
			  { }
ConfigStore::~ConfigStore() { }

Ev::Io<Util::Either<Ledger::Error, std::size_t>> ConfigStore::load() {
	return pimpl->load();
}
std::unique_ptr<std::string> ConfigStore::get(std::string const& key) const {
	return pimpl->get(key);
}
Ev::Io<Util::Either<Ledger::Error, std::string>>
ConfigStore::set(std::string const& key, std::string const& value) {
	return pimpl->set(key, value);
}
void ConfigStore::refresh(std::string const& key, std::string const& value) {
	pimpl->refresh(key, value);
}
Ledger::Settings ConfigStore::settings() const {
	return pimpl->settings();
}

}}
