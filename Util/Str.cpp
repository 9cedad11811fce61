#include<algorithm>
#include<cctype>
#include<stdio.h>
#include"Util/Str.hpp"

namespace Util {
namespace Str {

namespace {

bool is_space(char c) {
	return std::isspace((unsigned char) c) != 0;
}

}

std::string trim(std::string const& s) {
	auto start = std::find_if_not(s.begin(), s.end(), &is_space);
	/* If all spaces, empty string.  */
	if (start == s.end())
		return "";

	auto rend = std::find_if_not(s.rbegin(), s.rend(), &is_space);
	auto end = rend.base();

	return std::string(start, end);
}

std::vector<std::string> split(std::string const& s, char sep) {
	auto rv = std::vector<std::string>();
	auto start = s.begin();
	for (;;) {
		auto it = std::find(start, s.end(), sep);
		rv.emplace_back(start, it);
		if (it == s.end())
			break;
		start = it + 1;
	}
	return rv;
}

std::string replace_all(std::string s, char from, char to) {
	std::replace(s.begin(), s.end(), from, to);
	return s;
}

std::string vfmt(char const* tpl, va_list ap_orig) {
	va_list ap;

	auto written = std::size_t(0);
	auto size = std::size_t(64);
	auto buf = std::vector<char>();
	do {
		if (size <= written)
			size = written + 1;
		buf.resize(size);
		va_copy(ap, ap_orig);
		written = std::size_t(vsnprintf(&buf[0], size, tpl, ap));
		va_end(ap);
	} while (size <= written);

	return std::string(&buf[0], written);
}
std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto rv = vfmt(tpl, ap);
	va_end(ap);
	return rv;
}

}
}
