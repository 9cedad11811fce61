#ifndef SPLIT_NAME_HPP
#define SPLIT_NAME_HPP

#include<string>

namespace Split {

/* Group and member names: an ASCII letter or digit,
 * followed by any number of ASCII letters, digits,
 * `_`, `-`, `(` or `)`.
 */
bool valid_name(std::string const&);

}

#endif /* !defined(SPLIT_NAME_HPP) */
