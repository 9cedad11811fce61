#include"Split/Name.hpp"
#include<algorithm>

namespace {

bool is_alnum(char c) {
	return ('0' <= c && c <= '9')
	    || ('a' <= c && c <= 'z')
	    || ('A' <= c && c <= 'Z')
	     ;
}

}

namespace Split {

bool valid_name(std::string const& s) {
	if (s.empty())
		return false;
	if (!is_alnum(s[0]))
		return false;
	return std::all_of( s.begin() + 1, s.end()
			  , [](char c) {
		return is_alnum(c)
		    || c == '_' || c == '-' || c == '(' || c == ')'
		     ;
	});
}

}
