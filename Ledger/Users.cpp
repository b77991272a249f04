#include"Ledger/Error.hpp"
#include"Ledger/Users.hpp"
#include"Sqlite3.hpp"

namespace Ledger { namespace Users {

UserId ensure(Sqlite3::Tx& tx, std::string const& name) {
	tx.query(R"QRY(
	INSERT OR IGNORE INTO users (username) VALUES (:name);
	)QRY")
		.bind(":name", name)
		.execute()
		;
	auto rows = tx.query(R"QRY(
	SELECT id FROM users WHERE username = :name;
	)QRY")
		.bind(":name", name)
		.execute()
		;
	for (auto& r : rows)
		return r.get<UserId>(0);
	throw Ledger::InvariantViolation(
		"user '" + name + "' missing right after insert"
	);
}

std::int64_t count(Sqlite3::Tx& tx) {
	auto rows = tx.query("SELECT COUNT(*) FROM users;").execute();
	auto rv = std::int64_t(0);
	for (auto& r : rows)
		rv = r.get<std::int64_t>(0);
	return rv;
}

}}
