#undef NDEBUG
#include"Split/Error.hpp"
#include"Split/Target.hpp"
#include<assert.h>

namespace {

/* Returns the kind of error parsing throws.  */
Split::ErrorKind parse_error(std::string const& d, Split::Money total) {
	try {
		(void) Split::Target::parse(d, total);
	} catch (Split::Error const& e) {
		return e.kind();
	}
	assert(false);
	return Split::InvalidSemantic;
}

}

int main() {
	/* Wildcards.  */
	{
		auto t = Split::Target::parse("Alice", 1000);
		assert(t.member() == "Alice");
		assert(t.is_wildcard());
		assert(t == Split::Target::wildcard("Alice"));
	}

	/* Absolute amounts, in major units.  */
	{
		auto t = Split::Target::parse("Bob:12,50", 9999);
		assert(t.member() == "Bob");
		assert(!t.is_wildcard());
		assert(t.amount() == 1250);
		assert(t == Split::Target::exact("Bob", 1250));
		assert(t != Split::Target::wildcard("Bob"));
		assert(t != Split::Target::exact("Bob", 1251));
	}
	assert(Split::Target::parse("Bob:3.5", 0).amount() == 350);
	assert(Split::Target::parse("Bob:-5", 1000).amount() == -500);

	/* Percentages of the total, rounded half away from
	 * zero.  */
	assert(Split::Target::parse("Carol:50%", 1001).amount() == 501);
	assert(Split::Target::parse("Carol:25%", 1000).amount() == 250);
	assert(Split::Target::parse("Carol:12,5%", 1000).amount() == 125);
	assert(Split::Target::parse("Carol:100%", 777).amount() == 777);

	assert(Split::Target::parse("peter:25,22", 0).amount() == 2522);
	assert(Split::Target::parse("peter:25.22", 0).amount() == 2522);
	assert(Split::Target::parse("peter: 25.22 ", 0).amount() == 2522);
	assert(Split::Target::parse("peter:10%", 10000).amount() == 1000);

	/* Malformed directives.  */
	assert(parse_error(":", 100) == Split::InvalidTargetFormat);
	assert(parse_error(":25,22", 100) == Split::InvalidTargetFormat);
	assert(parse_error("25,22", 100) == Split::InvalidName);
	assert(parse_error("peter25,22", 100) == Split::InvalidName);
	assert(parse_error("peter:1.2.3", 100) == Split::InvalidNumberFormat);
	assert(parse_error("", 100) == Split::InvalidTargetFormat);
	assert(parse_error(":5", 100) == Split::InvalidTargetFormat);
	assert(parse_error("a:b:c", 100) == Split::InvalidTargetFormat);
	assert(parse_error("Al ice:5", 100) == Split::InvalidName);
	assert(parse_error("_x", 100) == Split::InvalidName);
	assert(parse_error("Alice:", 100) == Split::InvalidNumberFormat);
	assert(parse_error("Alice:%", 100) == Split::InvalidNumberFormat);
	assert(parse_error("Alice:5%%", 100) == Split::InvalidNumberFormat);
	assert(parse_error("Alice:five", 100) == Split::InvalidNumberFormat);

	/* Lists of directives.  */
	{
		auto ds = std::vector<std::string>{"Alice:10", "Bob", "Carol:25%"};
		auto p = Split::parse_multiple(ds, 2000);
		assert(p.targets.size() == 3);
		assert(p.targets[0] == Split::Target::exact("Alice", 1000));
		assert(p.targets[1] == Split::Target::wildcard("Bob"));
		assert(p.targets[2] == Split::Target::exact("Carol", 500));
		assert(p.explicit_sum == 1500);
		assert(p.wildcards == 1);
	}
	{
		auto p = Split::parse_multiple(std::vector<std::string>(), 2000);
		assert(p.targets.empty());
		assert(p.explicit_sum == 0);
		assert(p.wildcards == 0);
	}
	{
		/* Exactly the total is fine.  */
		auto ds = std::vector<std::string>{"Alice:10", "Bob:10"};
		auto p = Split::parse_multiple(ds, 2000);
		assert(p.explicit_sum == 2000);
	}
	{
		auto flag = false;
		try {
			auto ds = std::vector<std::string>{"Alice:15", "Bob:10"};
			(void) Split::parse_multiple(ds, 2000);
		} catch (Split::InvalidSemanticError const&) {
			flag = true;
		}
		assert(flag);
	}
	{
		/* Magnitude matters, not sign.  */
		auto flag = false;
		try {
			auto ds = std::vector<std::string>{"Alice:-25"};
			(void) Split::parse_multiple(ds, 2000);
		} catch (Split::InvalidSemanticError const&) {
			flag = true;
		}
		assert(flag);
	}

	/* Sums that do not fit in Money.  */
	{
		auto flag = false;
		try {
			auto ds = std::vector<std::string>{ "A:50000000000000000"
							  , "B:50000000000000000"
							  };
			(void) Split::parse_multiple(ds, Split::Money(9000000000000000000));
		} catch (Split::InvalidNumberFormatError const&) {
			flag = true;
		}
		assert(flag);
	}
	{
		auto flag = false;
		try {
			auto ds = std::vector<std::string>{ "A:-50000000000000000"
							  , "B:-50000000000000000"
							  };
			(void) Split::parse_multiple(ds, Split::Money(9000000000000000000));
		} catch (Split::InvalidNumberFormatError const&) {
			flag = true;
		}
		assert(flag);
	}

	return 0;
}
