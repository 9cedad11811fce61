#ifndef SQLITE3_QUERY_HPP
#define SQLITE3_QUERY_HPP

#include<cstddef>
#include<cstdint>
#include<memory>
#include<string>
#include<type_traits>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Query
 *
 * @brief a prepared statement whose named parameters
 * (`:name`) are bound before it is executed.
 *
 * @desc Integers of any width, `bool` included, are
 * bound as INTEGER; `std::string` and `char const*` as
 * TEXT; `nullptr` as NULL.
 * Binding a parameter the statement does not have
 * throws std::runtime_error.
 */
class Query {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Tx;
	Query(Sqlite3::Db const&, void*);

	Query& bind_integer(char const* field, std::int64_t value);

public:
	Query() =delete;
	Query(Query&&);
	~Query();

	template<typename a>
	typename std::enable_if<std::is_integral<a>::value, Query&>::type
	bind(char const* field, a value) {
		return bind_integer(field, std::int64_t(value));
	}
	Query& bind(char const* field, std::string const& value);
	Query& bind(char const* field, char const* value);
	Query& bind(char const* field, std::nullptr_t);

	/** Sqlite3::Query::execute
	 *
	 * @brief runs the statement up to its first row.
	 *
	 * @desc Parameters that were not bound are NULL.
	 * The query is used up afterwards.
	 */
	Result execute();
};

}

#endif /* !defined(SQLITE3_QUERY_HPP) */
