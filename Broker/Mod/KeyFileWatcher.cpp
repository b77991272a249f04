#include"Broker/Mod/Ingestor.hpp"
#include"Broker/Mod/KeyFileWatcher.hpp"
#include"Broker/Mod/Waiter.hpp"
#include"Broker/Msg/Begin.hpp"
#include"Broker/concurrent.hpp"
#include"Broker/log.hpp"
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<fstream>
#include<sstream>

namespace Broker { namespace Mod {

class KeyFileWatcher::Impl {
private:
	S::Bus& bus;
	Ev::ThreadPool& threadpool;
	Waiter& waiter;
	Ingestor& ingestor;
	std::string path;
	double interval;

	typedef Util::Either<Ledger::Error, std::size_t> Result;
	typedef std::unique_ptr<std::vector<std::string>> Lines;

	void start() {
		bus.subscribe<Msg::Begin>([this](Msg::Begin const&) {
			if (interval <= 0)
				return Broker::log( bus, Info
						  , "KeyFileWatcher: periodic "
						    "ingestion disabled."
						  );
			return Broker::concurrent(loop());
		});
	}

	Ev::Io<void> loop() {
		return pass().then([this](Result) {
			return waiter.wait(interval);
		}).then([this]() {
			return loop();
		});
	}

public:
	Impl( S::Bus& bus_
	    , Ev::ThreadPool& threadpool_
	    , Waiter& waiter_
	    , Ingestor& ingestor_
	    , std::string path_
	    , double interval_
	    ) : bus(bus_)
	      , threadpool(threadpool_)
	      , waiter(waiter_)
	      , ingestor(ingestor_)
	      , path(std::move(path_))
	      , interval(interval_)
	      { start(); }

	Ev::Io<Result> pass() {
		auto my_path = path;
		return threadpool.background<Lines>([my_path]() {
			auto is = std::ifstream(my_path);
			if (!is)
				return Lines();
			auto os = std::ostringstream();
			os << is.rdbuf();
			if (is.bad())
				return Lines();
			return Util::make_unique<std::vector<std::string>>(
				parse(os.str())
			);
		}).then([this](Lines lines) {
			if (!lines)
				return Broker::log( bus, Warn
						  , "KeyFileWatcher: cannot read %s; "
						    "will retry."
						  , path.c_str()
						  ).then([]() {
					return Ev::lift(Result::right(0));
				});
			return ingestor.sync(std::move(*lines));
		});
	}
};

KeyFileWatcher::KeyFileWatcher( S::Bus& bus
			      , Ev::ThreadPool& threadpool
			      , Waiter& waiter
			      , Ingestor& ingestor
			      , std::string path
			      , double interval
			      ) : pimpl(Util::make_unique<Impl>( bus, threadpool
							       , waiter, ingestor
							       , std::move(path)
							       , interval
							       ))
				{ }
KeyFileWatcher::~KeyFileWatcher() { }

Ev::Io<Util::Either<Ledger::Error, std::size_t>> KeyFileWatcher::pass() {
	return pimpl->pass();
}

std::vector<std::string> KeyFileWatcher::parse(std::string const& text) {
	auto rv = std::vector<std::string>();
	auto is = std::istringstream(text);
	auto line = std::string();
	while (std::getline(is, line)) {
		auto key = Util::Str::trim(line);
		if (!key.empty())
			rv.push_back(std::move(key));
	}
	return rv;
}

}}
