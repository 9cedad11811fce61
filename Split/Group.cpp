#include"Split/Allocator.hpp"
#include"Split/Error.hpp"
#include"Split/Group.hpp"
#include"Split/Name.hpp"
#include"Util/Str.hpp"
#include<sstream>

namespace {

std::string join(std::vector<std::string> const& names) {
	auto rv = std::string();
	for (auto const& n : names) {
		if (!rv.empty())
			rv += ", ";
		rv += n;
	}
	return rv;
}

}

namespace Split {

Group Group::create( std::string name
		   , std::vector<std::string> const& members
		   , Currency currency
		   ) {
	if (!valid_name(name))
		throw InvalidNameError("group name \"" + name + "\"");
	if (members.empty())
		throw InvalidSemanticError("a group must have at least one member");

	auto rv = Group();
	rv.nm = std::move(name);
	rv.cur = currency;
	for (auto const& m : members) {
		if (!valid_name(m))
			throw InvalidNameError("member name \"" + m + "\"");
		if (!rv.mems.insert(std::make_pair(m, Money(0))).second)
			throw InvalidNameError("member \"" + m + "\" listed twice");
	}
	return rv;
}

Group Group::restore( std::string name
		    , Currency currency
		    , std::map<std::string, Money> members
		    , std::vector<LogEntry> log
		    ) {
	auto rv = Group();
	rv.nm = std::move(name);
	rv.cur = currency;
	rv.mems = std::move(members);
	rv.lg = std::move(log);
	return rv;
}

Money Group::balance(std::string const& member) const {
	auto it = mems.find(member);
	if (it == mems.end())
		throw MemberNotFoundError(member);
	return it->second;
}

std::vector<std::string> Group::member_names() const {
	auto rv = std::vector<std::string>();
	rv.reserve(mems.size());
	for (auto const& m : mems)
		rv.push_back(m.first);
	return rv;
}

void Group::apply(Change const& change) {
	auto updated = Change();
	for (auto const& c : change) {
		auto it = mems.find(c.first);
		if (it == mems.end())
			throw MemberNotFoundError(Util::Str::fmt(
				"\"%s\" is not a member of group \"%s\"",
				c.first.c_str(), nm.c_str()
			));
		updated[c.first] = add_money(it->second, c.second);
	}
	for (auto const& u : updated)
		mems[u.first] = u.second;
}

void Group::log(LogEntry entry) {
	lg.push_back(std::move(entry));
}

std::size_t Group::resolve_index(std::size_t const* index) const {
	if (lg.empty())
		throw LogEntryNotFoundError("the log is empty");
	auto i = index ? *index : lg.size() - 1;
	if (i >= lg.size())
		throw LogEntryNotFoundError(Util::Str::fmt(
			"no entry %zu, the log has %zu entries",
			i, lg.size()
		));
	return i;
}

LogEntry const& Group::get_log() const {
	return lg[resolve_index(nullptr)];
}
LogEntry const& Group::get_log(std::size_t index) const {
	return lg[resolve_index(&index)];
}
LogEntry Group::remove_log() {
	auto i = resolve_index(nullptr);
	auto rv = std::move(lg[i]);
	lg.erase(lg.begin() + i);
	return rv;
}
LogEntry Group::remove_log(std::size_t index) {
	auto i = resolve_index(&index);
	auto rv = std::move(lg[i]);
	lg.erase(lg.begin() + i);
	return rv;
}

LogEntry Group::undo() {
	apply(get_log().reversed_change());
	return remove_log();
}
LogEntry Group::undo(std::size_t index) {
	apply(get_log(index).reversed_change());
	return remove_log(index);
}

void Group::pay(Money amount, std::string const& from, std::string const& to) {
	if (!has_member(from) || !has_member(to))
		throw MemberNotFoundError(Util::Str::fmt(
			"either \"%s\" or \"%s\" is not a member of group \"%s\"",
			from.c_str(), to.c_str(), nm.c_str()
		));
	if (from == to)
		throw InvalidSemanticError("cannot pay oneself");
	if (amount <= 0)
		throw InvalidSemanticError("payment amount must be positive");

	auto change = Change();
	change[from] = amount;
	change[to] = -amount;
	apply(change);
	log(LogEntry::pay(amount, from, to, std::move(change)));
}

Change Group::split( Money amount
		   , std::vector<std::string> const& from
		   , std::vector<std::string> const& to
		   , std::string name
		   , bool balance_rest
		   ) {
	auto alloc = split_into_transaction( amount, member_names()
					   , from, to, balance_rest
					   );
	apply(alloc.change);
	log(LogEntry::split( std::move(name), amount
			   , std::move(alloc.from), std::move(alloc.to)
			   , balance_rest
			   , alloc.change
			   ));
	return alloc.change;
}

std::vector<Settlement> Group::plan_settlement() const {
	return Split::plan_settlement(mems);
}

void Group::apply_settlement(std::vector<Settlement> const& settlements) {
	if (settlements.empty())
		return;
	auto change = settlement_change(settlements);
	apply(change);
	log(LogEntry::settle(settlements, std::move(change)));
}

void Group::add(std::vector<std::string> const& members) {
	auto duplicates = std::vector<std::string>();
	auto invalid = std::vector<std::string>();
	for (auto const& m : members) {
		if (mems.count(m) != 0)
			duplicates.push_back(m);
		else if (!valid_name(m))
			invalid.push_back(m);
		else
			mems[m] = 0;
	}
	if (!duplicates.empty() || !invalid.empty())
		throw InvalidNameError(
			"duplicates: [" + join(duplicates) + "], "
			"invalid names: [" + join(invalid) + "]"
		);
}

void Group::remove(std::vector<std::string> const& members, bool force) {
	auto failed = std::vector<std::string>();
	for (auto const& m : members) {
		auto it = mems.find(m);
		if (it == mems.end() || (it->second != 0 && !force)) {
			failed.push_back(m);
			continue;
		}
		mems.erase(it);
	}
	if (!failed.empty())
		throw InvalidNameError(
			"could not remove [" + join(failed) + "]: "
			"they are not members or still have to pay or "
			"get money"
		);
}

std::string Group::stat() const {
	auto os = std::ostringstream();
	os << "Group statistics for group " << nm
	   << " (" << std::string(cur) << "):" << std::endl
	   << "Members:" << std::endl
	   ;
	for (auto const& m : mems)
		os << m.first << ": " << cur.format(m.second) << std::endl;
	return os.str();
}

std::string Group::list() const {
	auto os = std::ostringstream();
	os << "Log listing for group " << nm
	   << " (" << std::string(cur) << ")" << std::endl
	   ;
	for (auto i = std::size_t(0); i < lg.size(); ++i)
		os << i << ": " << lg[i].to_string(cur) << std::endl;
	return os.str();
}

}
