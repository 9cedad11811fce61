#undef NDEBUG
#include"Cli/Options.hpp"
#include<assert.h>
#include<stdlib.h>

namespace {

typedef std::vector<std::string> Strings;

bool is_usage_error(Strings const& args) {
	try {
		(void) Cli::Options::parse(args);
	} catch (Cli::UsageError const&) {
		return true;
	}
	return false;
}

}

int main() {
	{
		auto o = Cli::Options::parse(Strings());
		assert(o.command.empty());
		assert(o.args.empty());
		assert(!o.is_help);
		assert(!o.is_version);
		assert(o.log_level == Cli::Info);
		assert(o.database.empty());
	}
	{
		auto o = Cli::Options::parse(Strings{
			"-d", "x.db", "-v", "create", "Trip", "-a", "Alice", "Bob",
			"--currency=USD"
		});
		assert(o.database == "x.db");
		assert(o.log_level == Cli::Debug);
		assert(o.command == "create");
		assert((o.args == Strings{"Trip"}));
		assert((o.members == Strings{"Alice", "Bob"}));
		assert(o.currency == "USD");
	}
	{
		auto o = Cli::Options::parse(Strings{
			"split", "12,50", "-f", "Alice:5", "Bob",
			"-t", "Carol:50%", "-n", "Lunch", "-b", "-q", "-g", "Trip"
		});
		assert(o.command == "split");
		assert((o.args == Strings{"12,50"}));
		assert((o.from == Strings{"Alice:5", "Bob"}));
		assert((o.to == Strings{"Carol:50%"}));
		assert(o.name == "Lunch");
		assert(o.balance_rest);
		assert(o.log_level == Cli::Warn);
		assert(o.group == "Trip");
	}
	{
		/* Repeated list options accumulate.  */
		auto o = Cli::Options::parse(Strings{
			"add", "-a", "Alice", "--add", "Bob", "--add=Carol"
		});
		assert((o.members == Strings{"Alice", "Bob", "Carol"}));
	}
	{
		auto o = Cli::Options::parse(Strings{
			"undo", "3", "-y", "--all", "--force"
		});
		assert(o.command == "undo");
		assert((o.args == Strings{"3"}));
		assert(o.yes);
		assert(o.all);
		assert(o.force);
	}
	assert(Cli::Options::parse(Strings{"--help"}).is_help);
	assert(Cli::Options::parse(Strings{"-V"}).is_version);
	/* A lone dash is a word, not an option.  */
	assert(Cli::Options::parse(Strings{"-"}).command == "-");

	assert(is_usage_error(Strings{"--bogus"}));
	assert(is_usage_error(Strings{"list", "-x"}));
	assert(is_usage_error(Strings{"list", "-g"}));
	assert(is_usage_error(Strings{"list", "--all=yes"}));

	/* Default database.  */
	setenv("GROUPSPLIT_DB", "/tmp/some.sqlite3", 1);
	assert(Cli::default_database_path() == "/tmp/some.sqlite3");
	unsetenv("GROUPSPLIT_DB");
	setenv("HOME", "/home/someone", 1);
	assert(Cli::default_database_path() == "/home/someone/.groupsplit.sqlite3");

	return 0;
}
