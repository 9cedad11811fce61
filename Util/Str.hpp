#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

/*
 * Minor string utilities.
 */

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#include<stdarg.h>
#include<string>
#include<vector>

namespace Util {
namespace Str {

std::string trim(std::string const& s);

/* Splits at every occurrence of the separator.
 * An empty input yields a single empty piece, and
 * adjacent separators yield empty pieces, so the
 * result always has (number of separators + 1)
 * entries.
 */
std::vector<std::string> split(std::string const& s, char sep);

/* Replaces every occurrence of `from` with `to`.  */
std::string replace_all(std::string s, char from, char to);

/* Like `sprintf`.  */
std::string fmt(char const *tpl, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 1, 2)))
#endif
;
std::string vfmt(char const *tpl, va_list ap);

}}

#endif /* !defined(UTIL_STR_HPP) */
