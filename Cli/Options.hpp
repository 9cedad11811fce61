#ifndef CLI_OPTIONS_HPP
#define CLI_OPTIONS_HPP

#include"Cli/log.hpp"
#include<stdexcept>
#include<string>
#include<vector>

namespace Cli {

/* Thrown on a malformed command line.  */
struct UsageError : public std::invalid_argument {
	explicit
	UsageError(std::string const& msg)
		: std::invalid_argument(msg) { }
};

/** struct Cli::Options
 *
 * @brief the parsed command line.
 *
 * @desc Options may appear anywhere on the command line;
 * the first word that is not an option or an option
 * argument is the command, the rest are its positional
 * arguments.
 * `--name=value` is accepted as well as `--name value`.
 * The list options `-a`, `-f` and `-t` take all words up
 * to the next option, so `-a Alice Bob` adds both; the
 * command must then come before them.
 */
struct Options {
	bool is_help;
	bool is_version;

	/* -d, --database; empty if not given.  */
	std::string database;
	/* -v lowers to Debug, -q raises to Warn.  */
	LogLevel log_level;

	std::string command;
	std::vector<std::string> args;

	/* -a, --add */
	std::vector<std::string> members;
	/* -f, --from */
	std::vector<std::string> from;
	/* -t, --to */
	std::vector<std::string> to;
	/* -n, --name */
	std::string name;
	/* -g, --group; empty means the current group.  */
	std::string group;
	/* -c, --currency */
	std::string currency;
	/* -b, --balance-rest */
	bool balance_rest;
	/* --all */
	bool all;
	/* --force */
	bool force;
	/* -y, --yes */
	bool yes;

	Options();

	/* Parses the arguments after the program name.
	 * Throws Cli::UsageError.  */
	static
	Options parse(std::vector<std::string> const& args);
};

/* The database used when none is given on the command
 * line: $GROUPSPLIT_DB, else ~/.groupsplit.sqlite3, else
 * a file of that name in the working directory.  */
std::string default_database_path();

}

#endif /* !defined(CLI_OPTIONS_HPP) */
