#include"Ev/Detail/run_queue.hpp"
#include"Ev/Io.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Tx.hpp"
#include<deque>
#include<exception>
#include<functional>
#include<sqlite3.h>

namespace {

/* On failure, closes `conn` and throws.  */
void setup_step(sqlite3*& conn, int res, char const* step) {
	if (res == SQLITE_OK)
		return;
	auto msg = std::string(conn ? sqlite3_errmsg(conn) : sqlite3_errstr(res));
	if (conn) {
		sqlite3_close_v2(conn);
		conn = nullptr;
	}
	throw Sqlite3::Error(res, std::string("Sqlite3::Db: ") + step + ": " + msg);
}

}

namespace Sqlite3 {

class Db::Impl {
public:
	sqlite3* connection;
	/* Whether some Tx currently owns the connection.  */
	bool taken;
	std::deque<std::function<void()>> next_in_line;

	Impl(std::string const& filename, int busy_timeout_ms)
		: connection(nullptr), taken(false) {
		auto flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
		setup_step( connection
			  , sqlite3_open_v2(filename.c_str(), &connection, flags, nullptr)
			  , "open"
			  );
		setup_step( connection
			  , sqlite3_extended_result_codes(connection, 1)
			  , "extended result codes"
			  );
		setup_step( connection
			  , sqlite3_busy_timeout(connection, busy_timeout_ms)
			  , "busy timeout"
			  );
		setup_step( connection
			  , sqlite3_exec( connection, "PRAGMA foreign_keys = ON;"
					, nullptr, nullptr, nullptr
					)
			  , "foreign keys"
			  );
	}
	~Impl() {
		if (connection)
			sqlite3_close_v2(connection);
	}
};

Db::Db( std::string const& filename
      , int busy_timeout_ms
      ) : pimpl(std::make_shared<Impl>(filename, busy_timeout_ms)) { }

void* Db::get_connection() const {
	return pimpl->connection;
}

void Db::transaction_finish() const {
	auto& line = pimpl->next_in_line;
	if (line.empty()) {
		pimpl->taken = false;
		return;
	}
	/* Still taken; ownership moves to the next waiter,
	 * which resumes from the loop rather than from
	 * inside the finishing Tx.  */
	auto next = std::move(line.front());
	line.pop_front();
	Ev::Detail::post(std::move(next));
}

Ev::Io<Sqlite3::Tx> Db::transact() {
	auto impl = pimpl.get();
	auto my_turn = Ev::Io<void>([impl]( std::function<void()> pass
					  , std::function<void(std::exception_ptr)>
					  ) {
		if (impl->taken)
			return impl->next_in_line.push_back(std::move(pass));
		impl->taken = true;
		pass();
	});
	auto self = *this;
	return my_turn.then([self]() {
		try {
			return Ev::lift(Sqlite3::Tx(self));
		} catch (std::exception const&) {
			/* BEGIN failed; let the next one try.  */
			self.transaction_finish();
			throw;
		}
	});
}

std::size_t Db::waiting() const {
	return pimpl->next_in_line.size();
}

}
