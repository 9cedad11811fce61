#undef NDEBUG
#include"Split/split_equal_among.hpp"
#include<assert.h>
#include<stdexcept>

namespace {

Split::Money sum(std::vector<Split::Money> const& v) {
	auto rv = Split::Money(0);
	for (auto m : v)
		rv += m;
	return rv;
}

}

int main() {
	{
		auto v = Split::split_equal_among(10, 3);
		assert((v == std::vector<Split::Money>{4, 3, 3}));
	}
	{
		auto v = Split::split_equal_among(-10, 3);
		assert((v == std::vector<Split::Money>{-4, -3, -3}));
	}
	{
		auto v = Split::split_equal_among(0, 4);
		assert((v == std::vector<Split::Money>{0, 0, 0, 0}));
	}
	{
		auto v = Split::split_equal_among(2, 5);
		assert((v == std::vector<Split::Money>{1, 1, 0, 0, 0}));
	}
	{
		auto v = Split::split_equal_among(100, 9);
		assert((v == std::vector<Split::Money>{12, 11, 11, 11, 11, 11, 11, 11, 11}));
		auto w = Split::split_equal_among(-100, 9);
		for (auto i = std::size_t(0); i < v.size(); ++i)
			assert(w[i] == -v[i]);
	}
	{
		auto v = Split::split_equal_among(12000, 1);
		assert((v == std::vector<Split::Money>{12000}));
	}

	/* Always sums back to the total, and no two parts
	 * differ by more than one unit.  */
	for (auto total = Split::Money(-50); total <= 50; ++total) {
		for (auto n = std::size_t(1); n <= 7; ++n) {
			auto v = Split::split_equal_among(total, n);
			assert(v.size() == n);
			assert(sum(v) == total);
			for (auto const& a : v)
				for (auto const& b : v)
					assert(a - b <= 1 && b - a <= 1);
		}
	}

	{
		auto flag = false;
		try {
			(void) Split::split_equal_among(10, 0);
		} catch (std::invalid_argument const&) {
			flag = true;
		}
		assert(flag);
	}

	return 0;
}
