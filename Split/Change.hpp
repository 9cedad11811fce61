#ifndef SPLIT_CHANGE_HPP
#define SPLIT_CHANGE_HPP

#include"Split/Money.hpp"
#include<map>
#include<string>

namespace Split {

/* Per-member balance delta of one transaction.
 * Changes produced by this library always sum to 0.
 */
typedef std::map<std::string, Money> Change;

Money change_sum(Change const&);
/* The change that undoes the given change.  */
Change reversed(Change const&);

}

#endif /* !defined(SPLIT_CHANGE_HPP) */
