#include"Split/LogEntry.hpp"
#include<sstream>
#include<stdexcept>

namespace {

std::string describe_targets( std::vector<Split::Target> const& ts
			    , Split::Currency const& cur
			    ) {
	auto os = std::ostringstream();
	auto first = true;
	for (auto const& t : ts) {
		if (!first)
			os << ", ";
		first = false;
		os << t.member() << ": ";
		if (t.is_wildcard())
			os << "*";
		else
			os << cur.format(t.amount());
	}
	return os.str();
}

}

namespace Split {

LogEntry LogEntry::split( std::string name, Money amount
			, std::vector<Target> from, std::vector<Target> to
			, bool balance_rest
			, Change change
			) {
	auto rv = LogEntry();
	rv.command = SplitCommand;
	rv.name = std::move(name);
	rv.amount = amount;
	rv.from = std::move(from);
	rv.to = std::move(to);
	rv.balance_rest = balance_rest;
	rv.change = std::move(change);
	return rv;
}
LogEntry LogEntry::pay( Money amount
		      , std::string payer, std::string payee
		      , Change change
		      ) {
	auto rv = LogEntry();
	rv.command = PayCommand;
	rv.amount = amount;
	rv.payer = std::move(payer);
	rv.payee = std::move(payee);
	rv.change = std::move(change);
	return rv;
}
LogEntry LogEntry::settle( std::vector<Settlement> settlements
			 , Change change
			 ) {
	auto rv = LogEntry();
	rv.command = SettleCommand;
	rv.settlements = std::move(settlements);
	rv.change = std::move(change);
	return rv;
}

std::string LogEntry::to_string(Currency const& cur) const {
	auto os = std::ostringstream();
	switch (command) {
	case SplitCommand:
		os << "split: `" << name << "` " << cur.format(amount)
		   << " paid by " << describe_targets(from, cur)
		   ;
		if (!to.empty())
			os << " for " << describe_targets(to, cur);
		if (balance_rest)
			os << ", balancing the rest";
		break;
	case PayCommand:
		os << "pay: " << payer << " to " << payee
		   << ": " << cur.format(amount)
		   ;
		break;
	case SettleCommand:
		os << "settle:";
		for (auto const& s : settlements)
			os << " " << s.from << " pays " << s.to
			   << " " << cur.format(s.amount) << ";"
			   ;
		break;
	}
	return os.str();
}

char const* command_name(LogEntry::Command c) {
	switch (c) {
	case LogEntry::SplitCommand: return "split";
	case LogEntry::PayCommand: return "pay";
	case LogEntry::SettleCommand: return "settle";
	}
	return "";
}

LogEntry::Command command_from_name(std::string const& s) {
	if (s == "split")
		return LogEntry::SplitCommand;
	if (s == "pay")
		return LogEntry::PayCommand;
	if (s == "settle")
		return LogEntry::SettleCommand;
	throw std::invalid_argument(
		"Split::command_from_name: unknown command: " + s
	);
}

}
