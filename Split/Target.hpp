#ifndef SPLIT_TARGET_HPP
#define SPLIT_TARGET_HPP

#include"Split/Money.hpp"
#include<cstddef>
#include<string>
#include<vector>

namespace Split {

/** class Split::Target
 *
 * @brief a member named in a `--from` or `--to`
 * directive, with the amount they pay or take.
 *
 * @desc A target without an amount is a wildcard: its
 * amount is determined later by splitting whatever was
 * not explicitly assigned equally among all wildcards.
 */
class Target {
private:
	std::string m;
	bool has_amount;
	Money a;

public:
	Target() : has_amount(false), a(0) { }
	Target(Target const&) =default;
	Target(Target&&) =default;
	Target& operator=(Target const&) =default;
	Target& operator=(Target&&) =default;
	~Target() =default;

	static
	Target wildcard(std::string member);
	static
	Target exact(std::string member, Money amount);

	/** Split::Target::parse
	 *
	 * @brief parses `<name>` or `<name>:<number>[%]`.
	 *
	 * @desc `<number>` is in major units and may use `,`
	 * or `.` as decimal separator.
	 * With a trailing `%` it is instead a percentage of
	 * `total`.
	 * Throws Split::InvalidTargetFormatError,
	 * Split::InvalidNumberFormatError or
	 * Split::InvalidNameError.
	 */
	static
	Target parse(std::string const& directive, Money total);

	std::string const& member() const { return m; }
	bool is_wildcard() const { return !has_amount; }
	/* Pre-condition: !is_wildcard().  */
	Money amount() const { return a; }

	bool operator==(Target const& o) const {
		return m == o.m
		    && has_amount == o.has_amount
		    && (!has_amount || a == o.a)
		     ;
	}
	bool operator!=(Target const& o) const {
		return !(*this == o);
	}
};

/** struct Split::ParsedTargets
 *
 * @brief result of parsing a whole list of directives.
 */
struct ParsedTargets {
	std::vector<Target> targets;
	/* Sum of all non-wildcard amounts.  */
	Money explicit_sum;
	/* Number of wildcard targets.  */
	std::size_t wildcards;
};

/* Parses each directive in order.
 * Throws Split::InvalidSemanticError if the explicit
 * amounts add up to more than `total` in magnitude.
 */
ParsedTargets parse_multiple( std::vector<std::string> const& directives
			    , Money total
			    );

}

#endif /* !defined(SPLIT_TARGET_HPP) */
