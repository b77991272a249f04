#undef NDEBUG
#include"Broker/Mod/Ingestor.hpp"
#include"Broker/Mod/KeyFileWatcher.hpp"
#include"Broker/Mod/Waiter.hpp"
#include"Broker/Msg/Begin.hpp"
#include"Broker/Shutdown.hpp"
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Ledger/Inventory.hpp"
#include"Ledger/Schema.hpp"
#include"Ledger/Store.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include<assert.h>
#include<cstddef>
#include<cstdint>
#include<cstdio>
#include<fstream>
#include<string>

namespace {

typedef Util::Either<Ledger::Error, std::size_t> Result;

auto const keys_path = std::string("test_keyfilewatcher.keys");
auto const missing_path = std::string("test_keyfilewatcher.missing");

void write_keys(std::string const& text) {
	auto os = std::ofstream(keys_path, std::ios::trunc);
	os << text;
}

Ev::Io<std::int64_t> count_all(Ledger::Store& store) {
	return store.transact<std::int64_t>([](Sqlite3::Tx& tx) {
		auto rv = Ledger::Inventory::count_all(tx);
		tx.commit();
		return rv;
	});
}

}

int main() {
	{
		auto lines = Broker::Mod::KeyFileWatcher::parse(
			"  K1 \n\nK2\r\n\t\n   \nK3"
		);
		assert(lines.size() == 3);
		assert(lines[0] == "K1");
		assert(lines[1] == "K2");
		assert(lines[2] == "K3");
		assert(Broker::Mod::KeyFileWatcher::parse("").empty());
	}

	std::remove(missing_path.c_str());
	write_keys("A1\nA2\n\nA3\n");

	auto bus = S::Bus();
	Ev::ThreadPool threadpool;
	Ledger::Store store(":memory:", 2);
	Broker::Mod::Waiter waiter(bus);
	Broker::Mod::Ingestor ingestor(bus, store);
	Broker::Mod::KeyFileWatcher watcher( bus, threadpool, waiter, ingestor
					   , keys_path, 0.05
					   );
	Broker::Mod::KeyFileWatcher missing( bus, threadpool, waiter, ingestor
					   , missing_path, 0
					   );

	auto code = Ev::lift().then([&]() {
		return store.transact<bool>([](Sqlite3::Tx& tx) {
			Ledger::Schema::create(tx);
			tx.commit();
			return true;
		});
	}).then([&](bool) {
		return watcher.pass();
	}).then([&](Result r) {
		assert(r == Result::right(3));
		return watcher.pass();
	}).then([&](Result r) {
		/* Nothing new on a second pass.  */
		assert(r == Result::right(0));

		/* An absent file is not an error.  */
		return missing.pass();
	}).then([&](Result r) {
		assert(r == Result::right(0));

		/* The source is replaced; existing keys stay.  */
		write_keys("B1\nB2\n");
		return bus.raise(Broker::Msg::Begin());
	}).then([&]() {
		return waiter.wait(0.5);
	}).then([&]() {
		return count_all(store);
	}).then([&](std::int64_t n) {
		/* The periodic loop picked up the new keys.  */
		assert(n == 5);

		write_keys("");
		return waiter.wait(0.2);
	}).then([&]() {
		return count_all(store);
	}).then([&](std::int64_t n) {
		assert(n == 5);

		/* Shutting down releases the parked loop.  */
		return bus.raise(Broker::Shutdown());
	}).then([&]() {
		return Ev::yield();
	}).then([&]() {
		assert(waiter.pending() == 0);
		std::remove(keys_path.c_str());
		return Ev::lift(0);
	});

	return Ev::start(code);
}
