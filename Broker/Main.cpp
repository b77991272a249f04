#include"Broker/ConsoleInput.hpp"
#include"Broker/Main.hpp"
#include"Broker/Mod/all.hpp"
#include"Broker/Msg/Begin.hpp"
#include"Broker/Msg/Init.hpp"
#include"Broker/Options.hpp"
#include"Broker/Shutdown.hpp"
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/yield.hpp"
#include"Ledger/Store.hpp"
#include"S/Bus.hpp"
#include"Sqlite3/Error.hpp"
#include"Util/make_unique.hpp"

#ifndef KEYBROKER_VERSION
# define KEYBROKER_VERSION "0.0.0-unknown"
#endif

namespace Broker {

class Main::Impl {
private:
	std::istream& in;
	std::ostream& out;
	std::ostream& err;

	std::string progname;
	Options options;
	/* Non-empty if the command line was rejected.  */
	std::string usage_error;

	/* Destroyed bottom-up, so modules go before
	 * whatever they refer to.  */
	S::Bus bus;
	std::unique_ptr<Ev::ThreadPool> workers;
	std::unique_ptr<Ledger::Store> store;
	std::unique_ptr<Broker::ConsoleInput> console;
	std::shared_ptr<void> modules;

	int status;

	/* Handles --help, --version and bad arguments.
	 * Returns the exit code, or -1 to keep going.  */
	int answer_without_ledger() {
		if (!usage_error.empty()) {
			err << progname << ": " << usage_error << std::endl
			    << Options::usage(progname);
			return 1;
		}
		if (options.show_help) {
			out << Options::usage(progname);
			return 0;
		}
		if (options.show_version) {
			out << "keybroker " << KEYBROKER_VERSION << std::endl;
			return 0;
		}
		return -1;
	}

	bool open_ledger() {
		try {
			store = Util::make_unique<Ledger::Store>( options.db_path
								, options.pool_size
								, options.busy_timeout_ms
								);
			return true;
		} catch (Sqlite3::Error const& e) {
			err << progname << ": cannot open " << options.db_path
			    << ": " << e.what() << std::endl;
			return false;
		}
	}

	void assemble() {
		workers = Util::make_unique<Ev::ThreadPool>();
		console = Util::make_unique<Broker::ConsoleInput>(
			*workers, in, bus
		);
		modules = Broker::Mod::all( out, err
					  , bus
					  , *workers
					  , *store
					  , options
					  );
	}

	/* Schema, config and the active round.  */
	Ev::Io<bool> initialize() {
		return bus.raise(Msg::Init{options.db_path}).then([]() {
			return Ev::lift(true);
		}).catching<std::exception>([this](std::exception const& e) {
			err << progname << ": startup failed: "
			    << e.what() << std::endl;
			status = 1;
			return Ev::lift(false);
		});
	}

	/* Console commands until end-of-file.  */
	Ev::Io<void> serve() {
		return bus.raise(Msg::Begin()).then([this]() {
			return console->run();
		}).catching<std::exception>([this](std::exception const& e) {
			err << progname << ": console stopped: "
			    << e.what() << std::endl;
			status = 1;
			return Ev::lift();
		});
	}

public:
	Impl( std::vector<std::string> argv
	    , std::istream& in_
	    , std::ostream& out_
	    , std::ostream& err_
	    ) : in(in_), out(out_), err(err_)
	      , progname(argv.empty() ? "keybroker" : argv[0])
	      , status(0) {
		try {
			options = Options::parse(argv);
		} catch (Options::Invalid const& e) {
			usage_error = e.what();
		}
	}

	Ev::Io<int> run() {
		auto early = answer_without_ledger();
		if (early >= 0)
			return Ev::lift(early);
		if (!open_ledger())
			return Ev::lift(1);
		assemble();

		return Ev::yield().then([this]() {
			return initialize();
		}).then([this](bool ready) {
			auto act = ready ? serve() : Ev::lift();
			return act + bus.raise(Broker::Shutdown());
		}).then([this]() {
			return Ev::lift(status);
		});
	}
};

Main::Main( std::vector<std::string> argv
	  , std::istream& in
	  , std::ostream& out
	  , std::ostream& err
	  ) : pimpl(Util::make_unique<Impl>(std::move(argv), in, out, err)) { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

Ev::Io<int> Main::run() {
	return pimpl->run();
}

}
