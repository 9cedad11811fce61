#ifndef SPLIT_STORE_HPP
#define SPLIT_STORE_HPP

#include"Sqlite3/Db.hpp"

namespace Split { class State; }

namespace Split {

/** class Split::Store
 *
 * @brief keeps a Split::State snapshot in an SQLITE3
 * database.
 *
 * @desc The whole ledger is loaded with `load` and
 * replaced wholesale with `save`; there are no
 * partial updates.
 * `save` runs in a single transaction, so a failure
 * leaves the previously saved snapshot intact.
 *
 * Throws std::runtime_error on database errors and on
 * snapshots written by an incompatible version.
 */
class Store {
private:
	Sqlite3::Db db;

public:
	Store() =delete;
	/* Creates the tables if they are missing.  */
	explicit
	Store(Sqlite3::Db db);

	/* An empty ledger if nothing was saved yet.  */
	State load();
	void save(State const&);
};

}

#endif /* !defined(SPLIT_STORE_HPP) */
