#ifndef SQLITE3_RESULT_HPP
#define SQLITE3_RESULT_HPP

#include"Sqlite3/Db.hpp"
#include<cstddef>
#include<cstdint>
#include<iterator>
#include<string>

namespace Sqlite3 { class Query; }
namespace Sqlite3 { class Result; }

namespace Sqlite3 {

/** class Sqlite3::Row
 *
 * @brief the row a Sqlite3::Result currently points
 * at.
 *
 * @desc Columns are read with `get<std::int64_t>`,
 * `get<bool>` or `get<std::string>`; a NULL column
 * reads as 0, false or an empty string, so check
 * `is_null` where NULL means something.
 */
class Row {
private:
	void* stmt;

	friend class Sqlite3::Result;
	Row() : stmt(nullptr) { }

public:
	Row(Row const&) =delete;
	Row& operator=(Row const&) =delete;

	template<typename a>
	a get(int c) const;
	bool is_null(int c) const;
};

template<>
std::int64_t Row::get<std::int64_t>(int c) const;
template<>
bool Row::get<bool>(int c) const;
template<>
std::string Row::get<std::string>(int c) const;

/** class Sqlite3::Result
 *
 * @brief the rows produced by an executed query.
 *
 * @desc Can be traversed only once, with a range
 * `for`; every row is the same `Row` object, moved
 * along the result.
 * A statement that yields no rows (INSERT, DELETE...)
 * has already run to completion when `execute`
 * returns.
 */
class Result {
private:
	Sqlite3::Db db;
	Row row;

	friend class Sqlite3::Query;
	Result(Sqlite3::Db const& db, void* stmt);

	/* Steps to the next row; false and finalized at
	 * the end.  Throws std::runtime_error.  */
	bool step();
	void finalize();

public:
	Result() =delete;
	Result(Result const&) =delete;
	Result(Result&&);
	~Result();

	class iterator {
	private:
		Result* r;

		friend class Sqlite3::Result;
		explicit
		iterator(Result* r_) : r(r_) { }

	public:
		typedef std::input_iterator_tag iterator_category;
		typedef Row value_type;
		typedef std::ptrdiff_t difference_type;
		typedef Row* pointer;
		typedef Row& reference;

		iterator() : r(nullptr) { }

		bool operator==(iterator const& o) const { return r == o.r; }
		bool operator!=(iterator const& o) const { return r != o.r; }

		Row& operator*() const { return r->row; }
		Row* operator->() const { return &r->row; }

		iterator& operator++() {
			if (r && !r->step())
				r = nullptr;
			return *this;
		}
	};

	iterator begin() {
		return iterator(row.stmt ? this : nullptr);
	}
	iterator end() {
		return iterator();
	}
};

}

#endif /* !defined(SQLITE3_RESULT_HPP) */
