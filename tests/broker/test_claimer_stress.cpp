#undef NDEBUG
#include"Broker/Mod/Claimer.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/map.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Ledger/Inventory.hpp"
#include"Ledger/Rounds.hpp"
#include"Ledger/Schema.hpp"
#include"Ledger/Store.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include<assert.h>
#include<cstddef>
#include<cstdint>
#include<set>
#include<string>
#include<vector>

namespace {

auto constexpr num_keys = std::size_t(40);
auto constexpr num_users = std::size_t(100);

auto claiming = false;
auto most_queued = std::size_t(0);

/* Records the longest queue for a pool slot while
 * the claims run.  */
Ev::Io<void> watch_queue(Ledger::Store& store) {
	return Ev::yield().then([&store]() {
		if (store.pending() > most_queued)
			most_queued = store.pending();
		if (!claiming)
			return Ev::lift();
		return watch_queue(store);
	});
}

}

int main() {
	auto bus = S::Bus();
	/* Fewer slots than callers, so most of them queue.  */
	Ledger::Store store(":memory:", 3);
	Broker::Mod::Claimer claimer(bus, store);

	typedef Broker::Mod::Claimer::Result Result;

	auto code = Ev::lift().then([&]() {
		return store.transact<bool>([](Sqlite3::Tx& tx) {
			Ledger::Schema::create(tx);
			Ledger::Rounds::open(tx, 1);
			for (auto i = std::size_t(0); i < num_keys; ++i)
				Ledger::Inventory::ingest(tx, "KEY-" + std::to_string(i));
			tx.commit();
			return true;
		});
	}).then([&](bool) {
		auto users = std::vector<std::string>();
		for (auto i = std::size_t(0); i < num_users; ++i)
			users.push_back("user" + std::to_string(i));
		claiming = true;
		return Ev::concurrent(watch_queue(store))
		     + Ev::map([&](std::string user) {
			return claimer.claim(user);
		}, std::move(users));
	}).then([&](std::vector<Result> results) {
		claiming = false;
		assert(results.size() == num_users);
		assert(store.pool_size() == 3);
		assert(most_queued > 0);
		assert(store.pending() == 0);

		auto given = std::set<std::string>();
		auto num_given = std::size_t(0);
		for (auto const& r : results) {
			if (r.is_right()) {
				++num_given;
				given.insert(r.right());
				continue;
			}
			assert(r.left() == Ledger::Error_PoolExhausted);
		}
		/* Every key handed out exactly once.  */
		assert(num_given == num_keys);
		assert(given.size() == num_keys);

		return claimer.count_unclaimed();
	}).then([&](Util::Either<Ledger::Error, std::int64_t> r) {
		assert(r.is_right());
		assert(r.right() == 0);

		return store.transact<std::int64_t>([](Sqlite3::Tx& tx) {
			auto fetch = tx.query(R"QRY(
			SELECT COUNT(*) FROM keys WHERE claimed = 1;
			)QRY").execute();
			auto rv = std::int64_t(0);
			for (auto& row : fetch)
				rv = row.get<std::int64_t>(0);
			tx.commit();
			return rv;
		});
	}).then([&](std::int64_t claimed) {
		assert(claimed == std::int64_t(num_keys));
		return Ev::lift(0);
	});

	return Ev::start(code);
}
