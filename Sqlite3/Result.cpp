#include"Sqlite3/Db.hpp"
#include"Sqlite3/Result.hpp"
#include<sqlite3.h>
#include<stdexcept>

namespace Sqlite3 {

template<>
std::int64_t Row::get<std::int64_t>(int c) const {
	return sqlite3_column_int64((sqlite3_stmt*) stmt, c);
}
template<>
bool Row::get<bool>(int c) const {
	return sqlite3_column_int64((sqlite3_stmt*) stmt, c) != 0;
}
template<>
std::string Row::get<std::string>(int c) const {
	auto s = (sqlite3_stmt*) stmt;
	/* Text before length, so the length is that of
	 * the UTF-8 text.  */
	auto text = (char const*) sqlite3_column_text(s, c);
	auto len = sqlite3_column_bytes(s, c);
	if (!text)
		return std::string();
	return std::string(text, std::size_t(len));
}
bool Row::is_null(int c) const {
	return sqlite3_column_type((sqlite3_stmt*) stmt, c) == SQLITE_NULL;
}

Result::Result(Sqlite3::Db const& db_, void* stmt) : db(db_) {
	row.stmt = stmt;
	(void) step();
}
Result::Result(Result&& o) : db(std::move(o.db)) {
	row.stmt = o.row.stmt;
	o.row.stmt = nullptr;
}
Result::~Result() {
	finalize();
}

void Result::finalize() {
	if (row.stmt)
		(void) sqlite3_finalize((sqlite3_stmt*) row.stmt);
	row.stmt = nullptr;
}

bool Result::step() {
	auto res = sqlite3_step((sqlite3_stmt*) row.stmt);
	if (res == SQLITE_ROW)
		return true;
	if (res == SQLITE_DONE) {
		finalize();
		return false;
	}

	auto connection = (sqlite3*) db.get_connection();
	auto err = std::string(sqlite3_errmsg(connection));
	finalize();
	throw std::runtime_error("Sqlite3::Result: " + err);
}

}
