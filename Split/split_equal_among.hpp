#ifndef SPLIT_SPLIT_EQUAL_AMONG_HPP
#define SPLIT_SPLIT_EQUAL_AMONG_HPP

#include"Split/Money.hpp"
#include<cstddef>
#include<vector>

namespace Split {

/** Split::split_equal_among
 *
 * @brief divides `total` into `among` shares that
 * differ by at most one minor unit and add up to
 * exactly `total`.
 *
 * @desc The leftover units go one each to the first
 * slots, in the direction of the sign of `total`, so
 * splitting a negative total mirrors splitting the
 * positive one.
 * Throws std::invalid_argument if `among` is 0.
 */
std::vector<Money> split_equal_among(Money total, std::size_t among);

}

#endif /* !defined(SPLIT_SPLIT_EQUAL_AMONG_HPP) */
