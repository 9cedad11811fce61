#include"Split/Error.hpp"
#include"Split/State.hpp"

namespace Split {

char const* const State::current_version = "0.1.0";

std::size_t State::index_of(std::string const& name) const {
	if (grps.empty())
		throw GroupNotFoundError("there are no groups yet");
	if (name.empty())
		return has_current() ? cur : 0;
	for (auto i = std::size_t(0); i < grps.size(); ++i)
		if (grps[i].name() == name)
			return i;
	throw GroupNotFoundError(name);
}

Group& State::create_group( std::string name
			  , std::vector<std::string> const& members
			  , Currency currency
			  ) {
	for (auto const& g : grps)
		if (g.name() == name)
			throw InvalidNameError("group \"" + name + "\" already exists");
	grps.push_back(Group::create(std::move(name), members, currency));
	cur = grps.size() - 1;
	return grps.back();
}

void State::restore_group(Group g) {
	auto had_current = has_current();
	grps.push_back(std::move(g));
	if (!had_current)
		cur = grps.size();
}

void State::delete_group(std::string const& name) {
	if (name.empty())
		throw GroupNotFoundError("no group name given");
	auto i = index_of(name);
	grps.erase(grps.begin() + i);
	cur = grps.size();
}

Group& State::get_group(std::string const& name) {
	return grps[index_of(name)];
}
Group const& State::get_group(std::string const& name) const {
	return grps[index_of(name)];
}

void State::select(std::string const& name) {
	cur = index_of(name);
}

}
