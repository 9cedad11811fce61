#include"Cli/Main.hpp"
#include"Cli/Options.hpp"
#include"Cli/log.hpp"
#include"Split/Error.hpp"
#include"Split/Group.hpp"
#include"Split/State.hpp"
#include"Split/Store.hpp"
#include"Sqlite3/Db.hpp"
#include"Util/make_unique.hpp"
#include<sstream>

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#ifndef PACKAGE_STRING
# define PACKAGE_STRING "groupsplit"
#endif
#ifndef PACKAGE_BUGREPORT
# define PACKAGE_BUGREPORT "the groupsplit maintainers"
#endif

namespace Cli {

class Main::Impl {
private:
	std::vector<std::string> argv;
	std::istream& cin;
	std::ostream& cout;

	Logger logger;
	Options opts;
	/* Exit code of a command that was saved anyway.  */
	int status;

	void usage() {
		auto const& argv0 = argv.empty() ? std::string("groupsplit")
						 : argv[0]
						 ;
		cout << "Usage: " << argv0 << " [-d DB] [-v|-q] <command> ..." << std::endl
		     << std::endl
		     << "Commands:" << std::endl
		     << " create NAME -a MEMBER... [-c EUR|USD|GBP|JPY]" << std::endl
		     << " add -a MEMBER... [-g GROUP]" << std::endl
		     << " remove -a MEMBER... [-g GROUP] [--force]" << std::endl
		     << " split AMOUNT -f FROM[:AMOUNT[%]]... [-t TO:AMOUNT[%]...] -n NAME [-g GROUP] [-b]" << std::endl
		     << " pay AMOUNT -f FROM -t TO [-g GROUP]" << std::endl
		     << " undo [INDEX] [-g GROUP] [-y]" << std::endl
		     << " delete-group NAME [-y]" << std::endl
		     << " list [-g GROUP] [--all]" << std::endl
		     << " stat [-g GROUP] [--all]" << std::endl
		     << " balance [-g GROUP] [-y]" << std::endl
		     << std::endl
		     << "Options:" << std::endl
		     << " --database, -d     Ledger database (default $GROUPSPLIT_DB or ~/.groupsplit.sqlite3)." << std::endl
		     << " --verbose, -v      Show debug messages." << std::endl
		     << " --quiet, -q        Only show warnings and errors." << std::endl
		     << " --version, -V      Show version." << std::endl
		     << " --help, -h         Show this help." << std::endl
		     << std::endl
		     << "Amounts are in major units, e.g. 12.50 or 12,50." << std::endl
		     << std::endl
		     << "Send bug reports to: " << PACKAGE_BUGREPORT << std::endl
		     ;
	}

	bool confirm() {
		if (opts.yes)
			return true;
		cout << "Confirm? [yY|nN]: " << std::flush;
		auto line = std::string();
		if (!std::getline(cin, line))
			return false;
		return !line.empty() && (line[0] == 'y' || line[0] == 'Y');
	}

	void expect_args(std::size_t n) {
		if (opts.args.size() != n)
			throw UsageError(
				"'" + opts.command + "' takes " +
				std::to_string(n) + " argument(s)"
			);
	}

	void print_change( Split::Group const& g
			 , Split::Change const& change
			 ) {
		for (auto const& c : change)
			cout << c.first << ": "
			     << (c.second > 0 ? "+" : "")
			     << g.currency().format(c.second)
			     << std::endl
			     ;
	}

	/* Each returns true if the ledger has to be saved.  */

	bool cmd_create(Split::State& state) {
		expect_args(1);
		auto currency = opts.currency.empty()
			? Split::Currency()
			: Split::Currency(opts.currency)
			;
		auto& g = state.create_group(opts.args[0], opts.members, currency);
		log( logger, Info, "Created group %s with %zu members."
		   , g.name().c_str(), g.members().size()
		   );
		return true;
	}

	/* Members that could be added or removed are kept
	 * even if others were rejected; the rejection still
	 * makes the command fail.  */
	bool cmd_add(Split::State& state) {
		expect_args(0);
		if (opts.members.empty())
			throw UsageError("'add' needs members (-a MEMBER...)");
		auto& g = state.get_group(opts.group);
		state.select(g.name());
		try {
			g.add(opts.members);
		} catch (Split::InvalidNameError const& e) {
			log(logger, Error, "%s", e.what());
			status = 1;
		}
		return true;
	}

	bool cmd_remove(Split::State& state) {
		expect_args(0);
		if (opts.members.empty())
			throw UsageError("'remove' needs members (-a MEMBER...)");
		auto& g = state.get_group(opts.group);
		state.select(g.name());
		try {
			g.remove(opts.members, opts.force);
		} catch (Split::InvalidNameError const& e) {
			log(logger, Error, "%s", e.what());
			status = 1;
		}
		return true;
	}

	bool cmd_split(Split::State& state) {
		expect_args(1);
		if (opts.name.empty())
			throw UsageError("'split' needs a name (-n NAME)");
		auto& g = state.get_group(opts.group);
		auto amount = g.currency().parse_major(opts.args[0]);
		auto change = g.split( amount, opts.from, opts.to
				     , opts.name, opts.balance_rest
				     );
		print_change(g, change);
		state.select(g.name());
		return true;
	}

	bool cmd_pay(Split::State& state) {
		expect_args(1);
		if (opts.from.size() != 1 || opts.to.size() != 1)
			throw UsageError("'pay' needs exactly one -f and one -t");
		auto& g = state.get_group(opts.group);
		auto amount = g.currency().parse_major(opts.args[0]);
		g.pay(amount, opts.from[0], opts.to[0]);
		state.select(g.name());
		return true;
	}

	bool cmd_undo(Split::State& state) {
		if (opts.args.size() > 1)
			throw UsageError("'undo' takes at most one index");
		auto& g = state.get_group(opts.group);
		auto has_index = !opts.args.empty();
		auto index = std::size_t(0);
		if (has_index) {
			auto is = std::istringstream(opts.args[0]);
			if (!(is >> index) || !is.eof())
				throw UsageError("not a log index: " + opts.args[0]);
		}

		auto const& entry = has_index ? g.get_log(index) : g.get_log();
		cout << "You are about to undo" << std::endl
		     << "`" << entry.to_string(g.currency()) << "`" << std::endl
		     << "This cannot be reversed." << std::endl
		     ;
		if (!confirm()) {
			cout << "Operation cancelled." << std::endl;
			return false;
		}
		if (has_index)
			g.undo(index);
		else
			g.undo();
		state.select(g.name());
		cout << "Success." << std::endl;
		return true;
	}

	bool cmd_delete_group(Split::State& state) {
		expect_args(1);
		auto const& name = opts.args[0];
		auto const& g = state.get_group(name);
		cout << "This will delete the group '" << name
		     << "' forever with no more undo options available."
		     << std::endl << std::endl
		     << g.stat()
		     ;
		if (!confirm()) {
			cout << "Operation cancelled." << std::endl;
			return false;
		}
		state.delete_group(name);
		log(logger, Info, "Deleted group %s.", name.c_str());
		return true;
	}

	bool cmd_list(Split::State& state) {
		expect_args(0);
		if (opts.all) {
			for (auto const& g : state.groups())
				cout << g.list() << std::endl;
			return false;
		}
		auto const& g = state.get_group(opts.group);
		cout << g.list();
		state.select(g.name());
		return true;
	}

	bool cmd_stat(Split::State& state) {
		expect_args(0);
		if (opts.all) {
			for (auto const& g : state.groups())
				cout << g.stat() << std::endl;
			return false;
		}
		auto const& g = state.get_group(opts.group);
		cout << g.stat();
		state.select(g.name());
		return true;
	}

	bool cmd_balance(Split::State& state) {
		expect_args(0);
		auto& g = state.get_group(opts.group);
		state.select(g.name());
		auto plan = g.plan_settlement();
		if (plan.empty()) {
			cout << "All balances are settled." << std::endl;
			return true;
		}
		cout << "The following transactions are recommended:" << std::endl;
		for (auto const& s : plan)
			cout << s.from << " \tpays " << s.to << ":\t"
			     << g.currency().format(s.amount) << std::endl
			     ;
		if (!confirm()) {
			cout << "Operation cancelled." << std::endl;
			return true;
		}
		g.apply_settlement(plan);
		cout << "Success." << std::endl;
		return true;
	}

	bool dispatch(Split::State& state) {
		auto const& c = opts.command;
		if (c == "create")
			return cmd_create(state);
		if (c == "add")
			return cmd_add(state);
		if (c == "remove")
			return cmd_remove(state);
		if (c == "split")
			return cmd_split(state);
		if (c == "pay")
			return cmd_pay(state);
		if (c == "undo")
			return cmd_undo(state);
		if (c == "delete-group")
			return cmd_delete_group(state);
		if (c == "list")
			return cmd_list(state);
		if (c == "stat")
			return cmd_stat(state);
		if (c == "balance")
			return cmd_balance(state);
		throw UsageError("Unrecognized command: " + c);
	}

	int run_command() {
		auto path = opts.database.empty() ? default_database_path()
						  : opts.database
						  ;
		log(logger, Debug, "Opening ledger %s", path.c_str());
		auto store = Split::Store(Sqlite3::Db(path));
		auto state = store.load();
		log( logger, Debug, "Loaded %zu groups."
		   , state.groups().size()
		   );

		status = 0;
		if (!dispatch(state))
			return status;

		store.save(state);
		log(logger, Debug, "Saved ledger %s", path.c_str());
		return status;
	}

public:
	Impl( std::vector<std::string> argv_
	    , std::istream& cin_
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    ) : argv(std::move(argv_))
	      , cin(cin_)
	      , cout(cout_)
	      , logger(cerr_)
	      , status(0)
	      { }

	int run() {
		try {
			auto args = std::vector<std::string>();
			if (argv.size() > 1)
				args.assign(argv.begin() + 1, argv.end());
			opts = Options::parse(args);
		} catch (UsageError const& e) {
			log(logger, Error, "%s", e.what());
			usage();
			return 2;
		}
		logger.set_threshold(opts.log_level);

		if (opts.is_version) {
			cout << PACKAGE_STRING << std::endl;
			return 0;
		}
		if (opts.is_help || opts.command.empty()) {
			usage();
			return opts.is_help ? 0 : 2;
		}

		try {
			return run_command();
		} catch (UsageError const& e) {
			log(logger, Error, "%s", e.what());
			return 2;
		} catch (Split::Error const& e) {
			log(logger, Error, "%s", e.what());
			return 1;
		} catch (std::exception const& e) {
			log(logger, Error, "%s", e.what());
			return 1;
		}
	}
};

Main::Main( std::vector<std::string> argv
	  , std::istream& cin
	  , std::ostream& cout
	  , std::ostream& cerr
	  ) : pimpl(Util::make_unique<Impl>(std::move(argv), cin, cout, cerr)) { }
Main::~Main() { }

int Main::run() {
	return pimpl->run();
}

}
