#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Result.hpp"
#include"Util/make_unique.hpp"
#include<sqlite3.h>
#include<stdexcept>

namespace Sqlite3 {

class Query::Impl {
private:
	Db db;
	sqlite3_stmt* stmt;

	void check(int res, char const* field) {
		if (res == SQLITE_OK)
			return;
		auto connection = (sqlite3*) db.get_connection();
		throw std::runtime_error(
			std::string("Sqlite3::Query::bind: ") + field + ": " +
			sqlite3_errmsg(connection)
		);
	}

public:
	Impl(Db const& db_, void* stmt_)
		: db(db_), stmt((sqlite3_stmt*) stmt_) { }
	~Impl() {
		if (stmt)
			(void) sqlite3_finalize(stmt);
	}

	int location(char const* field) const {
		if (!stmt)
			throw std::logic_error(
				"Sqlite3::Query::bind: query already executed"
			);
		auto res = sqlite3_bind_parameter_index(stmt, field);
		if (res == 0)
			throw std::runtime_error(
				std::string("Sqlite3::Query::bind: no field: ") +
				field
			);
		return res;
	}

	void bind_integer(char const* field, std::int64_t v) {
		check(sqlite3_bind_int64(stmt, location(field), v), field);
	}
	void bind_text(char const* field, char const* v, std::size_t len) {
		check(sqlite3_bind_text( stmt, location(field)
				       , v, int(len)
				       , SQLITE_TRANSIENT
				       ), field);
	}
	void bind_null(char const* field) {
		check(sqlite3_bind_null(stmt, location(field)), field);
	}

	Result execute() {
		if (!stmt)
			throw std::logic_error(
				"Sqlite3::Query::execute: query already executed"
			);
		/* The result finalizes the statement.  */
		auto my_stmt = stmt;
		stmt = nullptr;
		return Result(db, my_stmt);
	}
};

Query::Query(Sqlite3::Db const& db, void* stmt)
	: pimpl(Util::make_unique<Impl>(db, stmt)) { }
Query::Query(Query&& o) : pimpl(std::move(o.pimpl)) { }
Query::~Query() { }

Query& Query::bind_integer(char const* field, std::int64_t value) {
	pimpl->bind_integer(field, value);
	return *this;
}
Query& Query::bind(char const* field, std::string const& value) {
	pimpl->bind_text(field, value.c_str(), value.size());
	return *this;
}
Query& Query::bind(char const* field, char const* value) {
	if (!value)
		pimpl->bind_null(field);
	else
		pimpl->bind_text(field, value, std::char_traits<char>::length(value));
	return *this;
}
Query& Query::bind(char const* field, std::nullptr_t) {
	pimpl->bind_null(field);
	return *this;
}

Result Query::execute() {
	return pimpl->execute();
}

}
