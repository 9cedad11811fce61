#include"Split/Error.hpp"

namespace Split {

char const* error_kind_title(ErrorKind k) {
	switch (k) {
	case InvalidTargetFormat: return "Invalid Target Format";
	case InvalidNumberFormat: return "Invalid Number Format";
	case InvalidSemantic: return "Invalid Semantic";
	case InvalidName: return "Invalid Name";
	case MemberNotFound: return "Member not found";
	case GroupNotFound: return "Group not found";
	case LogEntryNotFound: return "Log entry not found";
	}
	return "Unknown error";
}

Error::Error(ErrorKind k_, std::string const& detail)
	: std::runtime_error( std::string(error_kind_title(k_))
			    + (detail.empty() ? "" : (": " + detail))
			    )
	, k(k_) { }

}
