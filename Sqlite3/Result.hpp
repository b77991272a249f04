#ifndef SQLITE3_RESULT_HPP
#define SQLITE3_RESULT_HPP

#include"Sqlite3/Db.hpp"
#include"Sqlite3/Detail/columns.hpp"
#include<cstddef>
#include<iterator>
#include<utility>

namespace Sqlite3 { class Query; }
namespace Sqlite3 { class Result; }

namespace Sqlite3 {

/** class Sqlite3::Row
 *
 * @brief view of the row a result is currently on.
 * Only valid until the result advances.
 */
class Row {
private:
	void* stmt;

	friend class Sqlite3::Result;
	explicit
	Row(void* stmt_) : stmt(stmt_) { }

public:
	template<typename a>
	a get(int c) const {
		auto value = typename Detail::Storage<a>::type();
		Detail::fetch(stmt, c, value);
		return a(std::move(value));
	}

	bool is_null(int c) const {
		return Detail::fetch_null(stmt, c);
	}
};

/** class Sqlite3::Result
 *
 * @brief rows produced by an executed query.
 *
 * @desc A result can be traversed exactly once.
 * The statement has already run up to its first row
 * when the result is constructed, so a statement
 * with no rows (INSERT, UPDATE) is complete as soon
 * as `execute()` returns.
 */
class Result {
private:
	Sqlite3::Db db;
	/* Null once the rows are exhausted.  */
	void* stmt;

	friend class Sqlite3::Query;

	Result(Sqlite3::Db const& db_, void* stmt_);

	void step();

public:
	Result() =delete;
	Result(Result const&) =delete;
	Result(Result&&);
	~Result();

	class iterator {
	private:
		Result* source;
		Row row;

		friend class Sqlite3::Result;
		explicit
		iterator(Result* source_)
			: source(source_ && source_->stmt ? source_ : nullptr)
			, row(source ? source->stmt : nullptr)
			{ }

	public:
		typedef std::input_iterator_tag iterator_category;
		typedef Row value_type;
		typedef Row* pointer;
		typedef Row& reference;
		typedef std::ptrdiff_t difference_type;

		iterator() : source(nullptr), row(nullptr) { }

		bool operator==(iterator const& o) const {
			return source == o.source;
		}
		bool operator!=(iterator const& o) const {
			return source != o.source;
		}

		iterator& operator++() {
			if (source) {
				source->step();
				if (!source->stmt)
					source = nullptr;
			}
			return *this;
		}

		Row& operator*() { return row; }
		Row* operator->() { return &row; }
	};

	iterator begin() { return iterator(this); }
	iterator end() { return iterator(); }
};

}

#endif /* !defined(SQLITE3_RESULT_HPP) */
