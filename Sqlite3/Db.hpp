#ifndef SQLITE3_DB_HPP
#define SQLITE3_DB_HPP

#include<memory>
#include<string>

namespace Sqlite3 { class Query; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Db
 *
 * @brief class to access an SQLITE3 database.
 *
 * @desc The primary member function here is `transact`,
 * which begins a transaction and returns a
 * `Sqlite3::Tx` object to run queries in.
 *
 * Copies share the same connection; the connection is
 * closed when the last copy is destroyed.
 */
class Db {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	friend class Sqlite3::Query;
	friend class Sqlite3::Result;
	friend class Sqlite3::Tx;

	void* get_connection() const;
	void transaction_finish();

public:
	/* Opens a database, creating it
	 * if absent.
	 * As typical for SQLITE3, ":memory:" creates an in-memory
	 * db, "" creates a new temporary db.
	 * Throws std::runtime_error if the database cannot
	 * be opened.
	 */
	explicit
	Db(std::string const& filename);

	/* Creates an empty/invalid db object.  */
	Db() =default;
	Db(Db const&) =default;
	Db(Db&&) =default;
	Db& operator=(Db const&) =default;
	Db& operator=(Db&&) =default;
	~Db() =default;

	/* If the Db is false (invalid), you cannot use transact().  */
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	/** Sqlite3::Db::transact
	 *
	 * @desc Begins a database transaction.
	 * Only one transaction may be in flight per
	 * connection; starting another before the first is
	 * committed or rolled back throws std::logic_error.
	 */
	Sqlite3::Tx transact();
};

}

#endif /* !defined(SQLITE3_DB_HPP) */
