#include"Cli/log.hpp"
#include"Util/Str.hpp"
#include<ostream>
#include<stdarg.h>

namespace Cli {

void Logger::write(LogLevel l, std::string const& msg) {
	if (l < threshold)
		return;

	auto level_string = std::string();
	switch (l) {
	case Trace: level_string = std::string("trace"); break;
	case Debug: level_string = std::string("debug"); break;
	case Info: level_string = std::string("info"); break;
	case Warn: level_string = std::string("warn"); break;
	case Error: level_string = std::string("error"); break;
	}

	os << prefix << ": " << level_string << ": " << msg << std::endl;
}

void log(Logger& logger, LogLevel l, const char *fmt, ...) {
	va_list ap;

	auto msg = std::string();

	va_start(ap, fmt);
	msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	logger.write(l, msg);
}

}
