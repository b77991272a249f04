#undef NDEBUG
#include"Broker/Mod/Claimer.hpp"
#include"Broker/Mod/CommandHandler.hpp"
#include"Broker/Mod/ConfigStore.hpp"
#include"Broker/Mod/Ingestor.hpp"
#include"Broker/Mod/Initiator.hpp"
#include"Broker/Mod/KeyFileWatcher.hpp"
#include"Broker/Mod/RoundManager.hpp"
#include"Broker/Mod/Waiter.hpp"
#include"Broker/Msg/CommandRequest.hpp"
#include"Broker/Msg/CommandResponse.hpp"
#include"Broker/Msg/Init.hpp"
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/start.hpp"
#include"Ledger/Store.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<cstdint>
#include<cstdio>
#include<fstream>
#include<string>
#include<vector>

namespace {

auto const keys_path = std::string("test_commandhandler.keys");

}

int main() {
	{
		auto os = std::ofstream(keys_path, std::ios::trunc);
		os << "KEY-A\nKEY-B\n";
	}

	auto bus = S::Bus();
	Ev::ThreadPool threadpool;
	Ledger::Store store(":memory:", 2);
	Broker::Mod::Waiter waiter(bus);
	Broker::Mod::ConfigStore config(bus, store, Ledger::Settings());
	Broker::Mod::RoundManager rounds( bus, store, config
					, Broker::Mod::RoundPolicy_Reopen
					);
	Broker::Mod::Claimer claimer(bus, store);
	Broker::Mod::Ingestor ingestor(bus, store);
	Broker::Mod::KeyFileWatcher watcher( bus, threadpool, waiter, ingestor
					   , keys_path, 0
					   );
	Broker::Mod::Initiator initiator(bus, store, config, rounds);
	Broker::Mod::CommandHandler handler( bus, claimer, rounds
					   , config, watcher
					   );

	auto next_id = std::uint64_t(0);
	auto responses = std::vector<Broker::Msg::CommandResponse>();
	bus.subscribe<Broker::Msg::CommandResponse>([&](Broker::Msg::CommandResponse const& r) {
		responses.push_back(r);
		return Ev::lift();
	});

	/* Runs one console line and returns what it printed
	 * (without the trailing newline).  */
	auto cmd = [&](std::string line) {
		auto words = Util::Str::words(line);
		auto req = Broker::Msg::CommandRequest();
		req.id = next_id++;
		req.command = words[0];
		req.args.assign(words.begin() + 1, words.end());
		auto id = req.id;
		auto before = responses.size();
		return bus.raise(req).then([&, id, before]() {
			/* Exactly one answer, to this request.  */
			assert(responses.size() == before + 1);
			auto const& r = responses.back();
			assert(r.id == id);
			auto out = std::string(r.ok ? "ok " : "error ") + r.command;
			if (!r.details.empty())
				out += " " + r.details;
			return Ev::lift(out);
		});
	};

	auto first = std::string();

	auto code = Ev::lift().then([&]() {
		return bus.raise(Broker::Msg::Init{":memory:"});
	}).then([&]() {
		return cmd("active-round");
	}).then([&](std::string out) {
		assert(out == "ok active-round 1");
		return cmd("remaining");
	}).then([&](std::string out) {
		assert(out == "ok remaining 0");
		return cmd("claim alice");
	}).then([&](std::string out) {
		assert(out == "error claim pool-exhausted");
		return cmd("ingest");
	}).then([&](std::string out) {
		assert(out == "ok ingest 2");
		return cmd("ingest");
	}).then([&](std::string out) {
		assert(out == "ok ingest 0");
		return cmd("claim alice");
	}).then([&](std::string out) {
		assert(out == "ok claim KEY-A" || out == "ok claim KEY-B");
		first = out.substr(std::string("ok claim ").size());
		return cmd("claim alice");
	}).then([&](std::string out) {
		assert(out == "error claim already-claimed-this-round");
		return cmd("grant alice");
	}).then([&](std::string out) {
		assert(out == "ok grant KEY-A" || out == "ok grant KEY-B");
		assert(out != "ok grant " + first);
		return cmd("claim bob");
	}).then([&](std::string out) {
		assert(out == "error claim pool-exhausted");

		return cmd("open-round 3");
	}).then([&](std::string out) {
		assert(out == "ok open-round 3");
		return cmd("active-round");
	}).then([&](std::string out) {
		assert(out == "ok active-round 3");
		return cmd("get current_round");
	}).then([&](std::string out) {
		assert(out == "ok get current_round 3");
		return cmd("open-round zero");
	}).then([&](std::string out) {
		assert(out == "error open-round usage");
		return cmd("open-round 0");
	}).then([&](std::string out) {
		assert(out == "error open-round round-rejected");

		return cmd("get role_id");
	}).then([&](std::string out) {
		assert(out == "error get missing");
		return cmd("set role_id Beta   Testers");
	}).then([&](std::string out) {
		assert(out == "ok set role_id Beta Testers");
		return cmd("get role_id");
	}).then([&](std::string out) {
		assert(out == "ok get role_id Beta Testers");
		assert(config.settings().role_id == "Beta Testers");
		return cmd("set age_bound many");
	}).then([&](std::string out) {
		assert(out == "error set invalid-setting");
		return cmd("set current_round 9");
	}).then([&](std::string out) {
		assert(out == "error set invalid-setting");
		return cmd("set age_bound");
	}).then([&](std::string out) {
		assert(out == "error set usage");

		return cmd("claim");
	}).then([&](std::string out) {
		assert(out == "error claim usage");
		return cmd("remaining now");
	}).then([&](std::string out) {
		assert(out == "error remaining usage");
		return cmd("frobnicate");
	}).then([&](std::string out) {
		assert(out == "error frobnicate unknown-command");
		return cmd("help");
	}).then([&](std::string out) {
		assert(out.substr(0, 8) == "ok help ");
		std::remove(keys_path.c_str());
		return Ev::lift(0);
	});

	return Ev::start(code);
}
