#ifndef SPLIT_ALLOCATOR_HPP
#define SPLIT_ALLOCATOR_HPP

#include"Split/Change.hpp"
#include"Split/Money.hpp"
#include"Split/Target.hpp"
#include<string>
#include<vector>

namespace Split {

/** struct Split::Allocation
 *
 * @brief the change an expense causes, together with
 * the resolved `--from` and `--to` targets, which are
 * kept for the log.
 */
struct Allocation {
	Change change;
	std::vector<Target> from;
	std::vector<Target> to;
};

/** Split::split_into_transaction
 *
 * @brief distributes an expense of `total` among the
 * group.
 *
 * @desc `members` lists every member of the group in
 * the group iteration order; remainder units of equal
 * splits are handed out in that order.
 *
 * The `from` directives say who fronted the money.
 * Wildcard payers share whatever the explicit payers
 * did not cover.
 *
 * The `to` directives say who consumed an explicit
 * part of the expense; the rest is shared equally by
 * everyone not named in `to`, or by everyone if
 * `balance_rest` is set.
 *
 * Nothing is applied; the caller applies and logs the
 * returned change.
 */
Allocation split_into_transaction( Money total
				 , std::vector<std::string> const& members
				 , std::vector<std::string> const& from
				 , std::vector<std::string> const& to
				 , bool balance_rest
				 );

}

#endif /* !defined(SPLIT_ALLOCATOR_HPP) */
