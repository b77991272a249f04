#include"Ledger/Config.hpp"
#include"Sqlite3.hpp"

namespace Ledger { namespace Config {

std::map<std::string, std::string> load(Sqlite3::Tx& tx) {
	auto rv = std::map<std::string, std::string>();
	auto rows = tx.query("SELECT key, value FROM config;").execute();
	for (auto& r : rows)
		rv[r.get<std::string>(0)] = r.get<std::string>(1);
	return rv;
}

void put(Sqlite3::Tx& tx, std::string const& key, std::string const& value) {
	tx.query(R"QRY(
	INSERT INTO config (key, value) VALUES (:key, :value)
	ON CONFLICT (key) DO UPDATE SET value = excluded.value;
	)QRY")
		.bind(":key", key)
		.bind(":value", value)
		.execute()
		;
}

}}
