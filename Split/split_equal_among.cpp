#include"Split/split_equal_among.hpp"
#include<stdexcept>

namespace Split {

std::vector<Money> split_equal_among(Money total, std::size_t among) {
	if (among == 0)
		throw std::invalid_argument(
			"Split::split_equal_among: cannot split among nobody"
		);

	auto n = Money(among);
	/* C++11 division truncates toward zero, and the
	 * remainder takes the sign of the dividend.  */
	auto base = total / n;
	auto remainder = total % n;
	auto step = Money(remainder < 0 ? -1 : 1);

	auto rv = std::vector<Money>(among, base);
	for (auto i = std::size_t(0); remainder != 0; ++i) {
		rv[i] += step;
		remainder -= step;
	}
	return rv;
}

}
