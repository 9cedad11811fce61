#ifndef SPLIT_MONEY_HPP
#define SPLIT_MONEY_HPP

#include<cstdint>
#include<iostream>
#include<string>

namespace Split {

/* Signed count of minor currency units (cents).
 * Positive balances are owed money by the group,
 * negative balances owe money to the group.
 */
typedef std::int64_t Money;

/** class Split::Currency
 *
 * @brief the display currency of a group.
 *
 * @desc Only affects how amounts are entered and
 * printed; there is no conversion between currencies.
 */
class Currency {
public:
	enum Code { EUR, USD, GBP, JPY };

private:
	Code c;

public:
	Currency() : c(EUR) { }
	Currency(Code c_) : c(c_) { }
	Currency(Currency const&) =default;
	Currency& operator=(Currency const&) =default;

	/* Accepts "EUR", "USD", "GBP", "JPY".
	 * Throws Split::InvalidNameError otherwise.
	 */
	explicit
	Currency(std::string const&);
	static
	bool valid_string(std::string const&);

	/* "EUR", "USD"...  */
	explicit
	operator std::string() const;

	Code code() const { return c; }
	/* "€", "$"...  */
	char const* symbol() const;
	/* Number of minor units in one major unit.  */
	Money subdivision() const;

	/* Converts a human-entered major-unit number, such
	 * as "12,50" or "12.5", to minor units, rounding
	 * half away from zero.
	 */
	Money parse_major(std::string const&) const;
	/* Formats minor units as major units with the
	 * currency symbol, e.g. "-12.50€".  */
	std::string format(Money) const;

	bool operator==(Currency const& o) const { return c == o.c; }
	bool operator!=(Currency const& o) const { return c != o.c; }
};

inline
std::ostream& operator<<(std::ostream& os, Currency const& c) {
	return os << c.symbol();
}

/** Split::parse_decimal
 *
 * @brief strictly parses a decimal number that uses
 * either `,` or `.` as the decimal separator.
 *
 * @desc Surrounding whitespace is ignored.
 * Accepts an optional sign, then digits with at most
 * one separator and at least one digit.
 * Throws Split::InvalidNumberFormatError on anything
 * else, including an empty string.
 */
double parse_decimal(std::string const&);

/* Rounds half away from zero to the nearest minor unit.  */
Money round_to_minor(double);

/* `a + b` and `a - b`, throwing
 * Split::InvalidNumberFormatError if the result does
 * not fit in Money.  */
Money add_money(Money a, Money b);
Money sub_money(Money a, Money b);

}

#endif /* !defined(SPLIT_MONEY_HPP) */
