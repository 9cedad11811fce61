#undef NDEBUG
#include"Split/Settlement.hpp"
#include<assert.h>
#include<stdexcept>

namespace {

typedef std::map<std::string, Split::Money> Balances;

/* Applies a plan and checks everyone ends at zero.  */
void check_settles(Balances b, std::vector<Split::Settlement> const& plan) {
	for (auto const& c : Split::settlement_change(plan))
		b[c.first] += c.second;
	for (auto const& e : b)
		assert(e.second == 0);
}

}

int main() {
	/* Nothing to do.  */
	assert(Split::plan_settlement(Balances()).empty());
	assert(Split::plan_settlement(Balances{{"A", 0}, {"B", 0}}).empty());

	/* Greedy, smallest first.  */
	{
		auto b = Balances{ {"Alice", -1685}, {"Bob", 316}
				 , {"Charly", 2117}, {"Django", -748}
				 };
		auto plan = Split::plan_settlement(b);
		assert(plan.size() == 3);
		assert(plan[0] == Split::Settlement("Django", "Bob", 316));
		assert(plan[1] == Split::Settlement("Django", "Charly", 432));
		assert(plan[2] == Split::Settlement("Alice", "Charly", 1685));
		check_settles(b, plan);
		/* Same balances, same plan.  */
		assert(Split::plan_settlement(b) == plan);
	}

	/* Exact matches are paired off first.  */
	{
		auto b = Balances{ {"A", -500}, {"B", -300}
				 , {"C", 300}, {"D", 500}
				 };
		auto plan = Split::plan_settlement(b);
		assert(plan.size() == 2);
		assert(plan[0] == Split::Settlement("B", "C", 300));
		assert(plan[1] == Split::Settlement("A", "D", 500));
		check_settles(b, plan);
	}

	/* A creditor zeroed by an exact match is not paid
	 * again.  */
	{
		auto b = Balances{ {"A", -100}, {"B", -250}
				 , {"C", 100}, {"D", 250}
				 };
		auto plan = Split::plan_settlement(b);
		assert(plan.size() == 2);
		for (auto const& s : plan)
			assert(s.amount > 0);
		check_settles(b, plan);
	}

	/* Many small debtors, one creditor.  */
	{
		auto b = Balances{ {"A", -1}, {"B", -2}, {"C", -3}
				 , {"D", 6}
				 };
		auto plan = Split::plan_settlement(b);
		assert(plan.size() == 3);
		for (auto const& s : plan)
			assert(s.to == "D");
		check_settles(b, plan);
	}

	/* One debtor, many creditors.  */
	{
		auto b = Balances{ {"A", 1}, {"B", 2}, {"C", 3}
				 , {"D", -6}
				 };
		auto plan = Split::plan_settlement(b);
		assert(plan.size() == 3);
		assert(plan[0] == Split::Settlement("D", "A", 1));
		assert(plan[1] == Split::Settlement("D", "B", 2));
		assert(plan[2] == Split::Settlement("D", "C", 3));
		check_settles(b, plan);
	}

	/* Debts nobody is owed cannot be settled.  */
	{
		auto flag = false;
		try {
			(void) Split::plan_settlement(Balances{{"A", -100}});
		} catch (std::invalid_argument const&) {
			flag = true;
		}
		assert(flag);
	}

	/* Amounts are stored as magnitudes.  */
	assert(Split::Settlement("A", "B", -5).amount == 5);

	/* Paying raises the payer and lowers the receiver,
	 * and repeated parties accumulate.  */
	{
		auto change = Split::settlement_change({
			Split::Settlement("D", "B", 316),
			Split::Settlement("D", "C", 432)
		});
		assert(change.size() == 3);
		assert(change["D"] == 748);
		assert(change["B"] == -316);
		assert(change["C"] == -432);
	}

	return 0;
}
