#ifndef SPLIT_ERROR_HPP
#define SPLIT_ERROR_HPP

#include<stdexcept>
#include<string>

namespace Split {

enum ErrorKind {
	InvalidTargetFormat,
	InvalidNumberFormat,
	InvalidSemantic,
	InvalidName,
	MemberNotFound,
	GroupNotFound,
	LogEntryNotFound
};

/* Human-readable title of the error kind, e.g.
 * "Invalid Target Format".
 */
char const* error_kind_title(ErrorKind);

/** class Split::Error
 *
 * @brief Base of all errors caused by bad input or by
 * a request that does not match the current ledger
 * state.
 *
 * @desc None of these are transient, so none are
 * worth retrying.
 * Each concrete kind has its own subclass below so
 * callers can catch exactly the kind they care about;
 * `kind()` is available for callers that would rather
 * switch.
 */
class Error : public std::runtime_error {
private:
	ErrorKind k;

public:
	Error(ErrorKind k_, std::string const& detail);

	ErrorKind kind() const { return k; }
};

struct InvalidTargetFormatError : public Error {
	explicit
	InvalidTargetFormatError(std::string const& detail)
		: Error(InvalidTargetFormat, detail) { }
};
struct InvalidNumberFormatError : public Error {
	explicit
	InvalidNumberFormatError(std::string const& detail)
		: Error(InvalidNumberFormat, detail) { }
};
struct InvalidSemanticError : public Error {
	explicit
	InvalidSemanticError(std::string const& detail)
		: Error(InvalidSemantic, detail) { }
};
struct InvalidNameError : public Error {
	explicit
	InvalidNameError(std::string const& detail)
		: Error(InvalidName, detail) { }
};
struct MemberNotFoundError : public Error {
	explicit
	MemberNotFoundError(std::string const& detail)
		: Error(MemberNotFound, detail) { }
};
struct GroupNotFoundError : public Error {
	explicit
	GroupNotFoundError(std::string const& detail)
		: Error(GroupNotFound, detail) { }
};
struct LogEntryNotFoundError : public Error {
	explicit
	LogEntryNotFoundError(std::string const& detail)
		: Error(LogEntryNotFound, detail) { }
};

}

#endif /* !defined(SPLIT_ERROR_HPP) */
