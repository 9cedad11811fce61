#include"Sqlite3/Db.hpp"
#include"Sqlite3/Tx.hpp"
#include<stdexcept>
#include<sqlite3.h>

namespace Sqlite3 {

class Db::Impl {
private:
	sqlite3* connection;

	bool in_transaction;

	void fail(char const* src) {
		auto msg = std::string(sqlite3_errmsg(connection));
		sqlite3_close_v2(connection);
		connection = nullptr;
		throw std::runtime_error(
			std::string("Sqlite3::Db: ") + src + ": " + msg
		);
	}

public:
	Impl(std::string const& filename) : connection(nullptr) {
		in_transaction = false;
		auto res = sqlite3_open(filename.c_str(), &connection);
		if (res != SQLITE_OK) {
			if (connection)
				fail("sqlite3_open");
			throw std::runtime_error(
				"Sqlite3::Db: sqlite3_open: Not enough memory"
			);
		}
		res = sqlite3_extended_result_codes(connection, 1);
		if (res != SQLITE_OK)
			fail("sqlite3_extended_result_codes");
		res = sqlite3_exec( connection, "PRAGMA foreign_keys = ON;"
				  , NULL, NULL, NULL
				  );
		if (res != SQLITE_OK)
			fail("PRAGMA foreign_keys = ON");
	}
	~Impl() {
		if (connection)
			sqlite3_close_v2(connection);
	}

	Tx transact(Db const& db) {
		if (in_transaction)
			throw std::logic_error(
				"Sqlite3::Db::transact: "
				"a transaction is already in flight"
			);
		auto tx = Tx(db);
		in_transaction = true;
		return tx;
	}
	void* get_connection() const { return connection; }
	void transaction_finish() {
		in_transaction = false;
	}
};

void* Db::get_connection() const {
	return pimpl->get_connection();
}
void Db::transaction_finish() {
	return pimpl->transaction_finish();
}
Tx Db::transact() {
	return pimpl->transact(*this);
}

Db::Db( std::string const& filename
      ) : pimpl(std::make_shared<Impl>(filename)) { }

}
