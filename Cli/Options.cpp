#include"Cli/Options.hpp"
#include<map>
#include<utility>
#include<stdlib.h>

namespace {

enum Kind {
	Flag,
	Value,
	List
};

struct OptionDef {
	Kind kind;
	/* Canonical long name.  */
	char const* name;
};

std::map<std::string, OptionDef> const& option_table() {
	static auto const table = std::map<std::string, OptionDef>{
		{"-h", {Flag, "help"}}, {"--help", {Flag, "help"}},
		{"-V", {Flag, "version"}}, {"--version", {Flag, "version"}},
		{"-v", {Flag, "verbose"}}, {"--verbose", {Flag, "verbose"}},
		{"-q", {Flag, "quiet"}}, {"--quiet", {Flag, "quiet"}},
		{"-d", {Value, "database"}}, {"--database", {Value, "database"}},
		{"-a", {List, "add"}}, {"--add", {List, "add"}},
		{"-f", {List, "from"}}, {"--from", {List, "from"}},
		{"-t", {List, "to"}}, {"--to", {List, "to"}},
		{"-n", {Value, "name"}}, {"--name", {Value, "name"}},
		{"-g", {Value, "group"}}, {"--group", {Value, "group"}},
		{"-c", {Value, "currency"}}, {"--currency", {Value, "currency"}},
		{"-b", {Flag, "balance-rest"}},
		{"--balance-rest", {Flag, "balance-rest"}},
		{"--all", {Flag, "all"}},
		{"--force", {Flag, "force"}},
		{"-y", {Flag, "yes"}}, {"--yes", {Flag, "yes"}}
	};
	return table;
}

void set_flag(Cli::Options& o, std::string const& name) {
	if (name == "help")
		o.is_help = true;
	else if (name == "version")
		o.is_version = true;
	else if (name == "verbose")
		o.log_level = Cli::Debug;
	else if (name == "quiet")
		o.log_level = Cli::Warn;
	else if (name == "balance-rest")
		o.balance_rest = true;
	else if (name == "all")
		o.all = true;
	else if (name == "force")
		o.force = true;
	else if (name == "yes")
		o.yes = true;
}

void set_value(Cli::Options& o, std::string const& name, std::string v) {
	if (name == "database")
		o.database = std::move(v);
	else if (name == "add")
		o.members.push_back(std::move(v));
	else if (name == "from")
		o.from.push_back(std::move(v));
	else if (name == "to")
		o.to.push_back(std::move(v));
	else if (name == "name")
		o.name = std::move(v);
	else if (name == "group")
		o.group = std::move(v);
	else if (name == "currency")
		o.currency = std::move(v);
}

}

namespace Cli {

Options::Options()
	: is_help(false)
	, is_version(false)
	, log_level(Info)
	, balance_rest(false)
	, all(false)
	, force(false)
	, yes(false)
	{ }

Options Options::parse(std::vector<std::string> const& args) {
	auto rv = Options();
	auto positional = std::vector<std::string>();

	for (auto i = std::size_t(0); i < args.size(); ++i) {
		auto const& arg = args[i];
		if (arg.size() < 2 || arg[0] != '-') {
			positional.push_back(arg);
			continue;
		}

		auto key = arg;
		auto inline_value = std::string();
		auto has_inline = false;
		auto eq = arg.find('=');
		if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
			key = arg.substr(0, eq);
			inline_value = arg.substr(eq + 1);
			has_inline = true;
		}

		auto it = option_table().find(key);
		if (it == option_table().end())
			throw UsageError("Unrecognized option: " + arg);
		auto const& def = it->second;

		if (def.kind == Flag) {
			if (has_inline)
				throw UsageError("Option takes no value: " + key);
			set_flag(rv, def.name);
			continue;
		}

		if (!has_inline) {
			if (i + 1 >= args.size())
				throw UsageError("Option needs a value: " + key);
			inline_value = args[++i];
		}
		set_value(rv, def.name, std::move(inline_value));

		/* A list option takes every following word up to
		 * the next option.  */
		if (def.kind == List && !has_inline)
			while ( i + 1 < args.size()
			     && (args[i + 1].empty() || args[i + 1][0] != '-')
			      )
				set_value(rv, def.name, args[++i]);
	}

	if (!positional.empty()) {
		rv.command = positional[0];
		rv.args.assign(positional.begin() + 1, positional.end());
	}
	return rv;
}

std::string default_database_path() {
	auto env = getenv("GROUPSPLIT_DB");
	if (env && *env)
		return std::string(env);
	auto home = getenv("HOME");
	if (home && *home)
		return std::string(home) + "/.groupsplit.sqlite3";
	return ".groupsplit.sqlite3";
}

}
