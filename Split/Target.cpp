#include"Split/Error.hpp"
#include"Split/Name.hpp"
#include"Split/Target.hpp"
#include"Util/Str.hpp"

namespace {

char const* const format_hint =
	"use the format <name>[:<number>[%]]";

}

namespace Split {

Target Target::wildcard(std::string member) {
	auto rv = Target();
	rv.m = std::move(member);
	rv.has_amount = false;
	rv.a = 0;
	return rv;
}
Target Target::exact(std::string member, Money amount) {
	auto rv = Target();
	rv.m = std::move(member);
	rv.has_amount = true;
	rv.a = amount;
	return rv;
}

Target Target::parse(std::string const& directive, Money total) {
	auto parts = Util::Str::split(directive, ':');
	auto const& name = parts[0];
	if (name.empty())
		throw InvalidTargetFormatError(
			"\"" + directive + "\": " + format_hint +
			" (missing name)"
		);
	if (parts.size() > 2)
		throw InvalidTargetFormatError(
			"\"" + directive + "\": " + format_hint +
			" (too many ':')"
		);
	if (!valid_name(name))
		throw InvalidNameError(name);

	if (parts.size() == 1)
		return wildcard(name);

	auto number = parts[1];
	auto percent = !number.empty() && number.back() == '%';
	if (percent) {
		number.pop_back();
		auto p = parse_decimal(number);
		return exact(name, round_to_minor(p / 100.0 * double(total)));
	}
	auto major = parse_decimal(number);
	return exact(name, round_to_minor(major * 100.0));
}

ParsedTargets parse_multiple( std::vector<std::string> const& directives
			    , Money total
			    ) {
	auto rv = ParsedTargets();
	rv.explicit_sum = 0;
	rv.wildcards = 0;
	rv.targets.reserve(directives.size());
	for (auto const& d : directives) {
		rv.targets.push_back(Target::parse(d, total));
		auto const& t = rv.targets.back();
		if (t.is_wildcard())
			++rv.wildcards;
		else
			rv.explicit_sum = add_money(rv.explicit_sum, t.amount());
	}
	auto magnitude = rv.explicit_sum < 0 ? sub_money(0, rv.explicit_sum)
					     : rv.explicit_sum
					     ;
	if (magnitude > total)
		throw InvalidSemanticError(Util::Str::fmt(
			"the explicit amounts sum up to more than the "
			"total amount: %lld vs %lld",
			(long long) rv.explicit_sum, (long long) total
		));
	return rv;
}

}
