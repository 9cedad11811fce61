#ifndef SPLIT_SETTLEMENT_HPP
#define SPLIT_SETTLEMENT_HPP

#include"Split/Change.hpp"
#include"Split/Money.hpp"
#include<map>
#include<string>
#include<utility>
#include<vector>

namespace Split {

/** struct Split::Settlement
 *
 * @brief a recommended payment of `amount` from the
 * debtor `from` to the creditor `to`.
 * `amount` is always positive.
 */
struct Settlement {
	std::string from;
	std::string to;
	Money amount;

	Settlement() : amount(0) { }
	Settlement(std::string from_, std::string to_, Money amount_)
		: from(std::move(from_))
		, to(std::move(to_))
		, amount(amount_ < 0 ? -amount_ : amount_)
		{ }

	bool operator==(Settlement const& o) const {
		return from == o.from && to == o.to && amount == o.amount;
	}
	bool operator!=(Settlement const& o) const {
		return !(*this == o);
	}
};

/** Split::plan_settlement
 *
 * @brief plans payments that bring every balance to 0.
 *
 * @desc Pre-condition: the balances sum to 0.
 *
 * Debtors that owe exactly what some creditor is owed
 * are paired off first.
 * Everyone else is settled greedily, smallest debtors
 * and smallest creditors first.
 * This keeps the number of payments low without
 * promising the minimum.
 *
 * The result depends only on the balances, so the same
 * ledger always gets the same plan.
 */
std::vector<Settlement>
plan_settlement(std::map<std::string, Money> const& balances);

/* The balance change of carrying out the payments:
 * payers gain, receivers lose, the same as a direct
 * payment.  */
Change settlement_change(std::vector<Settlement> const&);

}

#endif /* !defined(SPLIT_SETTLEMENT_HPP) */
