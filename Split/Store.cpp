#include"Split/Group.hpp"
#include"Split/LogEntry.hpp"
#include"Split/State.hpp"
#include"Split/Store.hpp"
#include"Sqlite3.hpp"
#include<limits>
#include<map>
#include<stdexcept>
#include<utility>

namespace {

/* (group id, sequence number within the group log).  */
typedef std::pair<std::int64_t, std::int64_t> EntryKey;

Split::Target load_target(Sqlite3::Row& r, int member_col, int amount_col) {
	auto member = r.get<std::string>(member_col);
	if (r.is_null(amount_col))
		return Split::Target::wildcard(std::move(member));
	return Split::Target::exact( std::move(member)
				   , r.get<std::int64_t>(amount_col)
				   );
}

void save_targets( Sqlite3::Tx& tx
		 , std::int64_t group_id, std::int64_t seq
		 , char const* side
		 , std::vector<Split::Target> const& targets
		 ) {
	for (auto i = std::size_t(0); i < targets.size(); ++i) {
		auto const& t = targets[i];
		auto q = tx.query(R"QRY(
		INSERT INTO "ledger_log_targets"
		VALUES(:group_id, :seq, :side, :pos, :member, :amount);
		)QRY");
		q.bind(":group_id", group_id)
		 .bind(":seq", seq)
		 .bind(":side", side)
		 .bind(":pos", std::int64_t(i))
		 .bind(":member", t.member())
		 ;
		if (t.is_wildcard())
			q.bind(":amount", nullptr);
		else
			q.bind(":amount", t.amount());
		q.execute();
	}
}

}

namespace Split {

Store::Store(Sqlite3::Db db_) : db(std::move(db_)) {
	auto tx = db.transact();
	tx.query_execute(R"QRY(
	CREATE TABLE IF NOT EXISTS "ledger_meta"
		( key TEXT PRIMARY KEY
		, value TEXT NOT NULL
		);
	CREATE TABLE IF NOT EXISTS "ledger_groups"
		( id INTEGER PRIMARY KEY
		, name TEXT NOT NULL UNIQUE
		, currency TEXT NOT NULL
		);
	CREATE TABLE IF NOT EXISTS "ledger_members"
		( group_id INTEGER NOT NULL
		      REFERENCES "ledger_groups"(id)
		, name TEXT NOT NULL
		, balance INTEGER NOT NULL
		, PRIMARY KEY (group_id, name)
		);
	CREATE TABLE IF NOT EXISTS "ledger_log"
		( group_id INTEGER NOT NULL
		      REFERENCES "ledger_groups"(id)
		, seq INTEGER NOT NULL
		, command TEXT NOT NULL
		, name TEXT NOT NULL
		, amount INTEGER NOT NULL
		, balance_rest INTEGER NOT NULL
		, payer TEXT NOT NULL
		, payee TEXT NOT NULL
		, PRIMARY KEY (group_id, seq)
		);
	-- amount is NULL for wildcard targets.
	CREATE TABLE IF NOT EXISTS "ledger_log_targets"
		( group_id INTEGER NOT NULL
		, seq INTEGER NOT NULL
		, side TEXT NOT NULL
		, pos INTEGER NOT NULL
		, member TEXT NOT NULL
		, amount INTEGER
		, PRIMARY KEY (group_id, seq, side, pos)
		, FOREIGN KEY (group_id, seq)
		      REFERENCES "ledger_log"(group_id, seq)
		);
	CREATE TABLE IF NOT EXISTS "ledger_log_changes"
		( group_id INTEGER NOT NULL
		, seq INTEGER NOT NULL
		, member TEXT NOT NULL
		, delta INTEGER NOT NULL
		, PRIMARY KEY (group_id, seq, member)
		, FOREIGN KEY (group_id, seq)
		      REFERENCES "ledger_log"(group_id, seq)
		);
	CREATE TABLE IF NOT EXISTS "ledger_log_settlements"
		( group_id INTEGER NOT NULL
		, seq INTEGER NOT NULL
		, pos INTEGER NOT NULL
		, payer TEXT NOT NULL
		, payee TEXT NOT NULL
		, amount INTEGER NOT NULL
		, PRIMARY KEY (group_id, seq, pos)
		, FOREIGN KEY (group_id, seq)
		      REFERENCES "ledger_log"(group_id, seq)
		);
	)QRY");
	tx.commit();
}

State Store::load() {
	auto tx = db.transact();
	auto rv = State();

	auto current = std::string();
	auto fetch = tx.query(R"QRY(
	SELECT key, value FROM "ledger_meta";
	)QRY").execute();
	for (auto& r : fetch) {
		auto key = r.get<std::string>(0);
		if (key == "version")
			rv.set_version(r.get<std::string>(1));
		else if (key == "current_group")
			current = r.get<std::string>(1);
	}
	if (rv.version() != State::current_version)
		throw std::runtime_error(
			"Split::Store: ledger was saved by version " +
			rv.version() + ", this is version " +
			State::current_version
		);

	auto members = std::map<std::int64_t, std::map<std::string, Money>>();
	auto members_res = tx.query(R"QRY(
	SELECT group_id, name, balance FROM "ledger_members";
	)QRY").execute();
	for (auto& r : members_res)
		members[r.get<std::int64_t>(0)][r.get<std::string>(1)]
			= r.get<std::int64_t>(2);

	auto entries = std::map<EntryKey, LogEntry>();
	auto entries_res = tx.query(R"QRY(
	SELECT group_id, seq, command, name, amount, balance_rest
	     , payer, payee
	  FROM "ledger_log";
	)QRY").execute();
	for (auto& r : entries_res) {
		auto& e = entries[EntryKey( r.get<std::int64_t>(0)
					  , r.get<std::int64_t>(1)
					  )];
		e.command = command_from_name(r.get<std::string>(2));
		e.name = r.get<std::string>(3);
		e.amount = r.get<std::int64_t>(4);
		e.balance_rest = r.get<bool>(5);
		e.payer = r.get<std::string>(6);
		e.payee = r.get<std::string>(7);
	}

	auto targets_res = tx.query(R"QRY(
	SELECT group_id, seq, side, member, amount
	  FROM "ledger_log_targets"
	 ORDER BY group_id, seq, side, pos;
	)QRY").execute();
	for (auto& r : targets_res) {
		auto& e = entries.at(EntryKey( r.get<std::int64_t>(0)
					     , r.get<std::int64_t>(1)
					     ));
		auto side = r.get<std::string>(2);
		auto t = load_target(r, 3, 4);
		if (side == "from")
			e.from.push_back(std::move(t));
		else
			e.to.push_back(std::move(t));
	}

	auto changes_res = tx.query(R"QRY(
	SELECT group_id, seq, member, delta FROM "ledger_log_changes";
	)QRY").execute();
	for (auto& r : changes_res) {
		auto& e = entries.at(EntryKey( r.get<std::int64_t>(0)
					     , r.get<std::int64_t>(1)
					     ));
		e.change[r.get<std::string>(2)] = r.get<std::int64_t>(3);
	}

	auto settlements_res = tx.query(R"QRY(
	SELECT group_id, seq, payer, payee, amount
	  FROM "ledger_log_settlements"
	 ORDER BY group_id, seq, pos;
	)QRY").execute();
	for (auto& r : settlements_res) {
		auto& e = entries.at(EntryKey( r.get<std::int64_t>(0)
					     , r.get<std::int64_t>(1)
					     ));
		e.settlements.emplace_back( r.get<std::string>(2)
					  , r.get<std::string>(3)
					  , r.get<std::int64_t>(4)
					  );
	}

	auto groups_res = tx.query(R"QRY(
	SELECT id, name, currency FROM "ledger_groups" ORDER BY id;
	)QRY").execute();
	for (auto& r : groups_res) {
		auto id = r.get<std::int64_t>(0);
		auto log = std::vector<LogEntry>();
		/* std::map orders by (id, seq), so this walks
		 * the group log in order.  */
		auto first = EntryKey(id, std::numeric_limits<std::int64_t>::min());
		auto it = entries.lower_bound(first);
		for (; it != entries.end() && it->first.first == id; ++it)
			log.push_back(std::move(it->second));
		rv.restore_group(Group::restore( r.get<std::string>(1)
					       , Currency(r.get<std::string>(2))
					       , std::move(members[id])
					       , std::move(log)
					       ));
	}

	if (!current.empty())
		rv.select(current);

	tx.commit();
	return rv;
}

void Store::save(State const& state) {
	auto tx = db.transact();
	tx.query_execute(R"QRY(
	DELETE FROM "ledger_log_settlements";
	DELETE FROM "ledger_log_changes";
	DELETE FROM "ledger_log_targets";
	DELETE FROM "ledger_log";
	DELETE FROM "ledger_members";
	DELETE FROM "ledger_groups";
	DELETE FROM "ledger_meta";
	)QRY");

	tx.query(R"QRY(
	INSERT INTO "ledger_meta" VALUES('version', :version);
	)QRY")
		.bind(":version", state.version())
		.execute()
		;
	tx.query(R"QRY(
	INSERT INTO "ledger_meta" VALUES('current_group', :name);
	)QRY")
		.bind( ":name"
		     , state.has_current() ? state.current_name()
					   : std::string()
		     )
		.execute()
		;

	auto const& groups = state.groups();
	for (auto gi = std::size_t(0); gi < groups.size(); ++gi) {
		auto const& g = groups[gi];
		auto id = std::int64_t(gi);
		tx.query(R"QRY(
		INSERT INTO "ledger_groups" VALUES(:id, :name, :currency);
		)QRY")
			.bind(":id", id)
			.bind(":name", g.name())
			.bind(":currency", std::string(g.currency()))
			.execute()
			;
		for (auto const& m : g.members())
			tx.query(R"QRY(
			INSERT INTO "ledger_members"
			VALUES(:group_id, :name, :balance);
			)QRY")
				.bind(":group_id", id)
				.bind(":name", m.first)
				.bind(":balance", m.second)
				.execute()
				;

		auto const& log = g.log();
		for (auto seq = std::size_t(0); seq < log.size(); ++seq) {
			auto const& e = log[seq];
			auto s = std::int64_t(seq);
			tx.query(R"QRY(
			INSERT INTO "ledger_log"
			VALUES( :group_id, :seq, :command, :name, :amount
			      , :balance_rest, :payer, :payee
			      );
			)QRY")
				.bind(":group_id", id)
				.bind(":seq", s)
				.bind(":command", command_name(e.command))
				.bind(":name", e.name)
				.bind(":amount", e.amount)
				.bind(":balance_rest", e.balance_rest)
				.bind(":payer", e.payer)
				.bind(":payee", e.payee)
				.execute()
				;
			save_targets(tx, id, s, "from", e.from);
			save_targets(tx, id, s, "to", e.to);
			for (auto const& c : e.change)
				tx.query(R"QRY(
				INSERT INTO "ledger_log_changes"
				VALUES(:group_id, :seq, :member, :delta);
				)QRY")
					.bind(":group_id", id)
					.bind(":seq", s)
					.bind(":member", c.first)
					.bind(":delta", c.second)
					.execute()
					;
			for (auto i = std::size_t(0); i < e.settlements.size(); ++i)
				tx.query(R"QRY(
				INSERT INTO "ledger_log_settlements"
				VALUES(:group_id, :seq, :pos, :payer, :payee, :amount);
				)QRY")
					.bind(":group_id", id)
					.bind(":seq", s)
					.bind(":pos", std::int64_t(i))
					.bind(":payer", e.settlements[i].from)
					.bind(":payee", e.settlements[i].to)
					.bind(":amount", e.settlements[i].amount)
					.execute()
					;
		}
	}

	tx.commit();
}

}
