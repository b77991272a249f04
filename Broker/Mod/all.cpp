#include"Broker/Mod/Claimer.hpp"
#include"Broker/Mod/CommandHandler.hpp"
#include"Broker/Mod/ConfigStore.hpp"
#include"Broker/Mod/ConsoleOutputter.hpp"
#include"Broker/Mod/Ingestor.hpp"
#include"Broker/Mod/Initiator.hpp"
#include"Broker/Mod/KeyFileWatcher.hpp"
#include"Broker/Mod/Logger.hpp"
#include"Broker/Mod/RoundManager.hpp"
#include"Broker/Mod/Waiter.hpp"
#include"Broker/Mod/all.hpp"
#include"Broker/Options.hpp"
#include"Ledger/Settings.hpp"
#include<vector>

namespace {

class All {
private:
	std::vector<std::shared_ptr<void>> modules;

public:
	template<typename M, typename... As>
	std::shared_ptr<M> install(As&&... as) {
		auto ptr = std::make_shared<M>(as...);
		modules.push_back(std::shared_ptr<void>(ptr));
		return ptr;
	}
};

}

namespace Broker { namespace Mod {

std::shared_ptr<void> all( std::ostream& cout
			 , std::ostream& cerr
			 , S::Bus& bus
			 , Ev::ThreadPool& threadpool
			 , Ledger::Store& store
			 , Broker::Options const& options
			 ) {
	auto all = std::make_shared<All>();

	/* Basic.  */
	all->install<Logger>(cerr, bus, options.log_level);
	all->install<ConsoleOutputter>(cout, bus);
	auto waiter = all->install<Waiter>(bus);

	/* Ledger.  */
	auto defaults = Ledger::Settings();
	defaults.age_bound = options.age_bound;
	defaults.giveaway_duration = options.giveaway_duration;
	auto config = all->install<ConfigStore>(bus, store, defaults);
	auto policy = options.strict_rounds ? RoundPolicy_Strict
					    : RoundPolicy_Reopen
					    ;
	auto rounds = all->install<RoundManager>(bus, store, *config, policy);
	auto claimer = all->install<Claimer>(bus, store);
	auto ingestor = all->install<Ingestor>(bus, store);
	auto watcher = all->install<KeyFileWatcher>( bus
						   , threadpool
						   , *waiter
						   , *ingestor
						   , options.keys_file
						   , double(options.ingest_interval)
						   );

	/* Startup.  */
	all->install<Initiator>(bus, store, *config, *rounds);

	/* Console.  */
	all->install<CommandHandler>( bus
				    , *claimer
				    , *rounds
				    , *config
				    , *watcher
				    );

	return all;
}

}}
