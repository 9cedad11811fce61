#ifndef CLI_LOG_HPP
#define CLI_LOG_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#include<iosfwd>
#include<string>
#include<utility>

namespace Cli {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/** class Cli::Logger
 *
 * @brief where diagnostics go, and which levels are
 * shown.
 *
 * @desc Diagnostics are for the person running the
 * command, never part of its output, so they are
 * written to the error stream.
 */
class Logger {
private:
	std::ostream& os;
	LogLevel threshold;
	std::string prefix;

public:
	Logger( std::ostream& os_
	      , LogLevel threshold_ = Info
	      , std::string prefix_ = "groupsplit"
	      ) : os(os_), threshold(threshold_), prefix(std::move(prefix_)) { }

	void set_threshold(LogLevel l) { threshold = l; }
	LogLevel get_threshold() const { return threshold; }

	void write(LogLevel l, std::string const& msg);
};

void log(Logger& logger, LogLevel l, const char *fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* CLI_LOG_HPP */
