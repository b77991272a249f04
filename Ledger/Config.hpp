#ifndef LEDGER_CONFIG_HPP
#define LEDGER_CONFIG_HPP

#include<map>
#include<string>

namespace Sqlite3 { class Tx; }

namespace Ledger { namespace Config {

/* Every stored key/value pair.  */
std::map<std::string, std::string> load(Sqlite3::Tx& tx);

/* Inserts or overwrites one pair.  */
void put(Sqlite3::Tx& tx, std::string const& key, std::string const& value);

}}

#endif /* !defined(LEDGER_CONFIG_HPP) */
