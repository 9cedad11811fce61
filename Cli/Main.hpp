#ifndef CLI_MAIN_HPP
#define CLI_MAIN_HPP

#include<iostream>
#include<memory>
#include<string>
#include<vector>

namespace Cli {

/** class Cli::Main
 *
 * @brief runs one `groupsplit` command.
 *
 * @desc Loads the ledger, performs the command given in
 * `argv`, and saves the ledger back if the command
 * changed it and succeeded.
 * Confirmation prompts are read from `cin`, results
 * are written to `cout`, diagnostics to `cerr`.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() =delete;
	Main(Main const&) =delete;

	Main( std::vector<std::string> argv
	    , std::istream& cin
	    , std::ostream& cout
	    , std::ostream& cerr
	    );
	~Main();

	/* Returns the process exit code.  */
	int run();
};

}

#endif /* !defined(CLI_MAIN_HPP) */
