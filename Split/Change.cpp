#include"Split/Change.hpp"

namespace Split {

Money change_sum(Change const& c) {
	auto rv = Money(0);
	for (auto const& e : c)
		rv += e.second;
	return rv;
}

Change reversed(Change const& c) {
	auto rv = Change();
	for (auto const& e : c)
		rv[e.first] = -e.second;
	return rv;
}

}
