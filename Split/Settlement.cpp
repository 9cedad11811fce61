#include"Split/Settlement.hpp"
#include<algorithm>
#include<stdexcept>

namespace {

struct Party {
	std::string name;
	/* Amount still owed to (creditor) or by (debtor)
	 * this party, as a magnitude.  */
	Split::Money open;
};

bool by_open(Party const& a, Party const& b) {
	return a.open < b.open;
}

}

namespace Split {

std::vector<Settlement>
plan_settlement(std::map<std::string, Money> const& balances) {
	auto creditors = std::vector<Party>();
	auto debtors = std::vector<Party>();
	for (auto const& b : balances) {
		if (b.second > 0)
			creditors.push_back(Party{b.first, b.second});
		else if (b.second < 0)
			debtors.push_back(Party{b.first, -b.second});
	}
	std::stable_sort(creditors.begin(), creditors.end(), &by_open);
	std::stable_sort(debtors.begin(), debtors.end(), &by_open);

	auto rv = std::vector<Settlement>();

	/* Pair off exact matches.  */
	for (auto& d : debtors) {
		for (auto& c : creditors) {
			if (c.open == 0)
				continue;
			if (c.open > d.open)
				break;
			if (c.open == d.open) {
				rv.emplace_back(d.name, c.name, c.open);
				c.open = 0;
				d.open = 0;
				break;
			}
		}
	}

	/* Settle the rest, smallest first.  */
	auto ci = std::size_t(0);
	for (auto& d : debtors) {
		while (d.open != 0) {
			while (ci < creditors.size() && creditors[ci].open == 0)
				++ci;
			if (ci == creditors.size())
				throw std::invalid_argument(
					"Split::plan_settlement: "
					"balances do not sum to zero"
				);
			auto& c = creditors[ci];
			auto amount = std::min(d.open, c.open);
			rv.emplace_back(d.name, c.name, amount);
			d.open -= amount;
			c.open -= amount;
		}
	}

	return rv;
}

Change settlement_change(std::vector<Settlement> const& settlements) {
	auto rv = Change();
	for (auto const& s : settlements) {
		rv[s.from] += s.amount;
		rv[s.to] -= s.amount;
	}
	return rv;
}

}
