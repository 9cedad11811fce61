#include"Split/Allocator.hpp"
#include"Split/Error.hpp"
#include"Split/split_equal_among.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<map>
#include<set>

namespace {

/* Indexes targets by member name, rejecting members
 * that are not in the group or are named twice.  */
std::map<std::string, Split::Target const*>
index_targets( std::vector<Split::Target> const& targets
	     , std::set<std::string> const& members
	     , char const* side
	     ) {
	auto rv = std::map<std::string, Split::Target const*>();
	for (auto const& t : targets) {
		if (members.count(t.member()) == 0)
			throw Split::MemberNotFoundError(Util::Str::fmt(
				"%s: no member \"%s\" in this group",
				side, t.member().c_str()
			));
		if (!rv.insert(std::make_pair(t.member(), &t)).second)
			throw Split::InvalidNameError(Util::Str::fmt(
				"%s: member \"%s\" named more than once",
				side, t.member().c_str()
			));
	}
	return rv;
}

}

namespace Split {

Allocation split_into_transaction( Money total
				 , std::vector<std::string> const& members
				 , std::vector<std::string> const& from
				 , std::vector<std::string> const& to
				 , bool balance_rest
				 ) {
	if (from.empty())
		throw InvalidSemanticError(
			"at least one --from directive is needed"
		);

	auto givers = parse_multiple(from, total);
	auto takers = parse_multiple(to, total);

	auto wildcard_taker = std::find_if( takers.targets.begin()
					  , takers.targets.end()
					  , [](Target const& t) {
		return t.is_wildcard();
	});
	if (wildcard_taker != takers.targets.end())
		throw InvalidTargetFormatError(
			"amounts for --to must be specified explicitly: " +
			wildcard_taker->member()
		);
	if (givers.wildcards == 0 && givers.explicit_sum != total)
		throw InvalidSemanticError(Util::Str::fmt(
			"--from amounts must either contain a wildcard "
			"or add up to the total: %lld vs %lld",
			(long long) givers.explicit_sum, (long long) total
		));

	auto member_set = std::set<std::string>(members.begin(), members.end());
	auto giver_of = index_targets(givers.targets, member_set, "--from");
	auto taker_of = index_targets(takers.targets, member_set, "--to");

	auto sharers = balance_rest ? members.size()
				    : members.size() - taker_of.size()
				    ;
	auto rest = sub_money(total, takers.explicit_sum);
	if (sharers == 0 && rest != 0)
		throw InvalidSemanticError(Util::Str::fmt(
			"everyone is named in --to, but their amounts "
			"do not add up to the total: %lld vs %lld",
			(long long) takers.explicit_sum, (long long) total
		));

	auto rv = Allocation();

	/* Positive leg: who fronted the money.  */
	auto wildcard_shares = std::vector<Money>();
	if (givers.wildcards != 0)
		wildcard_shares = split_equal_among( sub_money(total, givers.explicit_sum)
						   , givers.wildcards
						   );
	auto wi = std::size_t(0);
	for (auto const& m : members) {
		auto it = giver_of.find(m);
		if (it == giver_of.end())
			rv.change[m] = 0;
		else if (it->second->is_wildcard())
			rv.change[m] = wildcard_shares[wi++];
		else
			rv.change[m] = it->second->amount();
	}

	/* Negative leg: who consumed the expense.  */
	auto shares = std::vector<Money>();
	if (sharers != 0)
		shares = split_equal_among(rest, sharers);
	auto si = std::size_t(0);
	for (auto const& m : members) {
		auto& delta = rv.change[m];
		auto it = taker_of.find(m);
		if (it != taker_of.end()) {
			delta = sub_money(delta, it->second->amount());
			if (balance_rest)
				delta = sub_money(delta, shares[si++]);
		} else
			delta = sub_money(delta, shares[si++]);
	}

	rv.from = std::move(givers.targets);
	rv.to = std::move(takers.targets);
	return rv;
}

}
