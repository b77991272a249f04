#undef NDEBUG
#include"Broker/Mod/ConfigStore.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ledger/Config.hpp"
#include"Ledger/Schema.hpp"
#include"Ledger/Store.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include<assert.h>
#include<cstddef>
#include<string>

namespace {

typedef Util::Either<Ledger::Error, std::string> SetResult;
typedef Util::Either<Ledger::Error, std::size_t> LoadResult;

Ev::Io<bool> execute(Ledger::Store& store, char const* sql) {
	return store.transact<bool>([sql](Sqlite3::Tx& tx) {
		tx.query_execute(sql);
		tx.commit();
		return true;
	});
}

}

int main() {
	auto bus = S::Bus();
	Ledger::Store store(":memory:", 2);

	auto defaults = Ledger::Settings();
	defaults.giveaway_duration = 600;
	Broker::Mod::ConfigStore config(bus, store, defaults);
	Broker::Mod::ConfigStore other(bus, store, defaults);

	auto code = Ev::lift().then([&]() {
		return store.transact<bool>([](Sqlite3::Tx& tx) {
			Ledger::Schema::create(tx);
			/* A value written by something else, and one
			 * that cannot be used.  */
			Ledger::Config::put(tx, "role_id", "1234");
			Ledger::Config::put(tx, "age_bound", "soon");
			tx.commit();
			return true;
		});
	}).then([&](bool) {
		return config.load();
	}).then([&](LoadResult r) {
		/* The unusable one is not mirrored.  */
		assert(r == LoadResult::right(1));
		assert(config.get("role_id"));
		assert(*config.get("role_id") == "1234");
		assert(!config.get("age_bound"));
		assert(!config.get("giveaway_duration"));

		auto s = config.settings();
		assert(s.has_role_id);
		assert(s.role_id == "1234");
		/* Unusable override falls back to the default.  */
		assert(s.age_bound == Ledger::Settings::default_age_bound);
		assert(s.giveaway_duration == 600);

		return config.set("giveaway_duration", " 1800 ");
	}).then([&](SetResult r) {
		/* Stored in canonical form.  */
		assert(r == SetResult::right("1800"));
		/* Visible right away.  */
		assert(*config.get("giveaway_duration") == "1800");
		assert(config.settings().giveaway_duration == 1800);
		/* Others see it only after a reload.  */
		assert(!other.get("giveaway_duration"));

		return config.set("giveaway_duration", "0");
	}).then([&](SetResult r) {
		assert(r == SetResult::left(Ledger::Error_InvalidSetting));
		assert(config.settings().giveaway_duration == 1800);
		return config.set("age_bound", "-1");
	}).then([&](SetResult r) {
		assert(r == SetResult::left(Ledger::Error_InvalidSetting));
		return config.set("favourite_colour", "blue");
	}).then([&](SetResult r) {
		assert(r == SetResult::left(Ledger::Error_InvalidSetting));
		assert(!config.get("favourite_colour"));
		return config.set("age_bound", "7");
	}).then([&](SetResult r) {
		assert(r == SetResult::right("7"));
		return other.load();
	}).then([&](LoadResult r) {
		assert(r == LoadResult::right(3));
		auto s = other.settings();
		assert(s.giveaway_duration == 1800);
		assert(s.age_bound == 7);
		assert(s.role_id == "1234");

		/* Cache-only refresh does not touch the database.  */
		config.refresh("role_id", "999");
		assert(*config.get("role_id") == "999");
		return config.load();
	}).then([&](LoadResult r) {
		assert(r.is_right());
		assert(*config.get("role_id") == "1234");

		return execute(store, R"QRY(
		CREATE TRIGGER freeze_insert BEFORE INSERT ON config
		BEGIN SELECT RAISE(ABORT, 'config is frozen'); END;
		CREATE TRIGGER freeze_update BEFORE UPDATE ON config
		BEGIN SELECT RAISE(ABORT, 'config is frozen'); END;
		)QRY");
	}).then([&](bool) {
		return config.set("age_bound", "9");
	}).then([&](SetResult r) {
		/* A failed write leaves the mirror alone.  */
		assert(r == SetResult::left(Ledger::Error_TransactionFailed));
		assert(*config.get("age_bound") == "7");
		assert(config.settings().age_bound == 7);
		return config.set("role_id", "42");
	}).then([&](SetResult r) {
		assert(r == SetResult::left(Ledger::Error_TransactionFailed));
		assert(*config.get("role_id") == "1234");

		return execute(store, R"QRY(
		DROP TRIGGER freeze_insert;
		DROP TRIGGER freeze_update;
		PRAGMA query_only = ON;
		)QRY");
	}).then([&](bool) {
		/* No more writes can begin at all.  */
		return config.set("age_bound", "9");
	}).then([&](SetResult r) {
		assert(r == SetResult::left(Ledger::Error_StorageUnavailable));
		assert(*config.get("age_bound") == "7");
		return config.load();
	}).then([&](LoadResult r) {
		assert(r == LoadResult::left(Ledger::Error_StorageUnavailable));
		/* Nor does a failed load.  */
		assert(*config.get("role_id") == "1234");
		assert(config.settings().age_bound == 7);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
