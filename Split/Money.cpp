#include"Split/Error.hpp"
#include"Split/Money.hpp"
#include"Util/Str.hpp"
#include<cmath>
#include<cstdlib>
#include<limits>
#include<locale>
#include<sstream>

namespace Split {

bool Currency::valid_string(std::string const& s) {
	return s == "EUR" || s == "USD" || s == "GBP" || s == "JPY";
}

Currency::Currency(std::string const& s) {
	if (s == "EUR")
		c = EUR;
	else if (s == "USD")
		c = USD;
	else if (s == "GBP")
		c = GBP;
	else if (s == "JPY")
		c = JPY;
	else
		throw InvalidNameError("Currency \"" + s + "\" not supported");
}

Currency::operator std::string() const {
	switch (c) {
	case EUR: return "EUR";
	case USD: return "USD";
	case GBP: return "GBP";
	case JPY: return "JPY";
	}
	return "EUR";
}

char const* Currency::symbol() const {
	switch (c) {
	case EUR: return "\xe2\x82\xac";
	case USD: return "$";
	case GBP: return "\xc2\xa3";
	case JPY: return "\xc2\xa5";
	}
	return "";
}

Money Currency::subdivision() const {
	/* All supported currencies are entered in
	 * hundredths, JPY included, to keep the ledger
	 * format uniform.  */
	return 100;
}

Money Currency::parse_major(std::string const& s) const {
	return round_to_minor(parse_decimal(s) * double(subdivision()));
}

std::string Currency::format(Money m) const {
	auto sub = subdivision();
	auto neg = m < 0;
	/* Avoid overflow on negation by working in unsigned.  */
	auto mag = neg ? (std::uint64_t(0) - std::uint64_t(m))
		       : std::uint64_t(m)
		       ;
	auto os = std::ostringstream();
	if (neg)
		os << "-";
	os << (mag / std::uint64_t(sub));
	os << ".";
	auto frac = mag % std::uint64_t(sub);
	if (frac < 10)
		os << "0";
	os << frac;
	os << symbol();
	return os.str();
}

double parse_decimal(std::string const& input) {
	auto s = Util::Str::trim(input);
	auto fail = [&input]() {
		return InvalidNumberFormatError(
			"\"" + input + "\" is not a valid number"
		);
	};

	auto i = std::size_t(0);
	if (i < s.size() && (s[i] == '-' || s[i] == '+'))
		++i;
	auto digits = std::size_t(0);
	auto separators = std::size_t(0);
	for (; i < s.size(); ++i) {
		auto c = s[i];
		if ('0' <= c && c <= '9')
			++digits;
		else if (c == '.' || c == ',')
			++separators;
		else
			throw fail();
	}
	if (digits == 0 || separators > 1)
		throw fail();

	auto is = std::istringstream(Util::Str::replace_all(s, ',', '.'));
	is.imbue(std::locale::classic());
	auto rv = double();
	is >> rv;
	if (is.fail())
		throw fail();
	return rv;
}

namespace {

Split::InvalidNumberFormatError out_of_range(char const* op, Money a, Money b) {
	return Split::InvalidNumberFormatError(Util::Str::fmt(
		"amount out of range: %lld %s %lld",
		(long long) a, op, (long long) b
	));
}

}

Money add_money(Money a, Money b) {
	auto const max = std::numeric_limits<Money>::max();
	auto const min = std::numeric_limits<Money>::min();
	if ((b > 0 && a > max - b) || (b < 0 && a < min - b))
		throw out_of_range("+", a, b);
	return a + b;
}
Money sub_money(Money a, Money b) {
	auto const max = std::numeric_limits<Money>::max();
	auto const min = std::numeric_limits<Money>::min();
	if ((b < 0 && a > max + b) || (b > 0 && a < min + b))
		throw out_of_range("-", a, b);
	return a - b;
}

Money round_to_minor(double v) {
	if (!(std::fabs(v) < double(std::numeric_limits<Money>::max())))
		throw InvalidNumberFormatError("amount out of range");
	return Money(std::llround(v));
}

}
