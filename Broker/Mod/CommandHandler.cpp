#include"Broker/Mod/Claimer.hpp"
#include"Broker/Mod/CommandHandler.hpp"
#include"Broker/Mod/ConfigStore.hpp"
#include"Broker/Mod/KeyFileWatcher.hpp"
#include"Broker/Mod/RoundManager.hpp"
#include"Broker/Msg/CommandRequest.hpp"
#include"Broker/Msg/CommandResponse.hpp"
#include"Broker/log.hpp"
#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<cstdint>
#include<functional>
#include<map>
#include<string>

namespace {

auto const help_text = std::string(
	"commands: claim USER, grant USER, open-round N, active-round, "
	"remaining, get KEY, set KEY VALUE, ingest, help"
);

}

namespace Broker { namespace Mod {

class CommandHandler::Impl {
private:
	S::Bus& bus;
	Claimer& claimer;
	RoundManager& rounds;
	ConfigStore& config;
	KeyFileWatcher& watcher;

	typedef std::function<Ev::Io<void>(Msg::CommandRequest const&)>
		Handler;
	std::map<std::string, Handler> handlers;

	Ev::Io<void> respond( Msg::CommandRequest const& req
			    , bool ok
			    , std::string details
			    ) {
		return bus.raise(Msg::CommandResponse{
			req.id, ok, req.command, std::move(details)
		});
	}
	Ev::Io<void> fail(Msg::CommandRequest const& req, Ledger::Error e) {
		return respond(req, false, Ledger::error_reason(e));
	}
	Ev::Io<void> usage(Msg::CommandRequest const& req) {
		return respond(req, false, "usage");
	}

	void start() {
		handlers["claim"] = [this](Msg::CommandRequest const& req) {
			return do_claim(req, true);
		};
		handlers["grant"] = [this](Msg::CommandRequest const& req) {
			return do_claim(req, false);
		};
		handlers["open-round"] = [this](Msg::CommandRequest const& req) {
			return open_round(req);
		};
		handlers["active-round"] = [this](Msg::CommandRequest const& req) {
			return active_round(req);
		};
		handlers["remaining"] = [this](Msg::CommandRequest const& req) {
			return remaining(req);
		};
		handlers["get"] = [this](Msg::CommandRequest const& req) {
			return get(req);
		};
		handlers["set"] = [this](Msg::CommandRequest const& req) {
			return set(req);
		};
		handlers["ingest"] = [this](Msg::CommandRequest const& req) {
			return ingest(req);
		};
		handlers["help"] = [this](Msg::CommandRequest const& req) {
			return respond(req, true, help_text);
		};

		bus.subscribe<Msg::CommandRequest>([this](Msg::CommandRequest const& req) {
			auto it = handlers.find(req.command);
			if (it == handlers.end())
				return Broker::log( bus, Debug
						  , "CommandHandler: unknown command '%s'."
						  , req.command.c_str()
						  ) + respond(req, false, "unknown-command");
			return it->second(req);
		});
	}

	Ev::Io<void> do_claim(Msg::CommandRequest const& req, bool checked) {
		if (req.args.size() != 1)
			return usage(req);
		auto act = checked ? claimer.claim(req.args[0])
				   : claimer.claim_unchecked(req.args[0])
				   ;
		return act.then([this, req](Claimer::Result r) {
			if (r.is_left())
				return fail(req, r.left());
			return respond(req, true, r.right());
		});
	}

	Ev::Io<void> open_round(Msg::CommandRequest const& req) {
		auto n = std::int64_t();
		if (req.args.size() != 1 || !Util::Str::parse_int(req.args[0], n))
			return usage(req);
		return rounds.open_round(n).then([this, req](Util::Either<Ledger::Error, Ledger::RoundNumber> r) {
			if (r.is_left())
				return fail(req, r.left());
			return respond(req, true, std::to_string(r.right()));
		});
	}

	Ev::Io<void> active_round(Msg::CommandRequest const& req) {
		if (!req.args.empty())
			return usage(req);
		return rounds.get_active_round().then([this, req](Util::Either<Ledger::Error, Ledger::ActiveRound> r) {
			if (r.is_left())
				return fail(req, r.left());
			auto active = r.right();
			if (!active.exists)
				return respond(req, true, "none");
			return respond(req, true, std::to_string(active.number));
		});
	}

	Ev::Io<void> remaining(Msg::CommandRequest const& req) {
		if (!req.args.empty())
			return usage(req);
		return claimer.count_unclaimed().then([this, req](Util::Either<Ledger::Error, std::int64_t> r) {
			if (r.is_left())
				return fail(req, r.left());
			return respond(req, true, std::to_string(r.right()));
		});
	}

	Ev::Io<void> get(Msg::CommandRequest const& req) {
		if (req.args.size() != 1)
			return usage(req);
		auto const& key = req.args[0];
		auto value = config.get(key);
		if (!value)
			return respond(req, false, "missing");
		return respond(req, true, key + " " + *value);
	}

	Ev::Io<void> set(Msg::CommandRequest const& req) {
		if (req.args.size() < 2)
			return usage(req);
		auto key = req.args[0];
		/* Only open-round moves the round counter.  */
		if (key == "current_round")
			return fail(req, Ledger::Error_InvalidSetting);
		auto value = Util::Str::join(req.args.begin() + 1, req.args.end());
		return config.set(key, value).then([this, req, key](Util::Either<Ledger::Error, std::string> r) {
			if (r.is_left())
				return fail(req, r.left());
			return respond(req, true, key + " " + r.right());
		});
	}

	Ev::Io<void> ingest(Msg::CommandRequest const& req) {
		if (!req.args.empty())
			return usage(req);
		return watcher.pass().then([this, req](Util::Either<Ledger::Error, std::size_t> r) {
			if (r.is_left())
				return fail(req, r.left());
			return respond(req, true, std::to_string(r.right()));
		});
	}

public:
	Impl( S::Bus& bus_
	    , Claimer& claimer_
	    , RoundManager& rounds_
	    , ConfigStore& config_
	    , KeyFileWatcher& watcher_
	    ) : bus(bus_)
	      , claimer(claimer_)
	      , rounds(rounds_)
	      , config(config_)
	      , watcher(watcher_)
	      { start(); }
};

CommandHandler::CommandHandler( S::Bus& bus
			      , Claimer& claimer
			      , RoundManager& rounds
			      , ConfigStore& config
			      , KeyFileWatcher& watcher
			      ) : pimpl(Util::make_unique<Impl>( bus
							       , claimer
							       , rounds
							       , config
							       , watcher
							       ))
				{ }
CommandHandler::~CommandHandler() { }

}}
