#ifndef SQLITE3_HPP
#define SQLITE3_HPP

#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Result.hpp"
#include"Sqlite3/Tx.hpp"

#endif /* !defined(SQLITE3_HPP) */
