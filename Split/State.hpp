#ifndef SPLIT_STATE_HPP
#define SPLIT_STATE_HPP

#include"Split/Group.hpp"
#include"Split/Money.hpp"
#include<cstddef>
#include<string>
#include<vector>

namespace Split {

/** class Split::State
 *
 * @brief the whole ledger: every group, plus which
 * group is "current", i.e. used when a command does
 * not name one.
 *
 * @desc This is the unit that is loaded at startup and
 * saved back after a command.
 * Group selection is always explicit: callers pass the
 * group name, or an empty string for the current
 * group.
 */
class State {
private:
	std::string ver;
	std::vector<Group> grps;
	/* grps.size() if there is no current group.  */
	std::size_t cur;

	std::size_t index_of(std::string const& name) const;

public:
	static char const* const current_version;

	State() : ver(current_version), cur(0) { }
	State(State const&) =default;
	State(State&&) =default;
	State& operator=(State const&) =default;
	State& operator=(State&&) =default;
	~State() =default;

	std::string const& version() const { return ver; }
	void set_version(std::string v) { ver = std::move(v); }

	std::vector<Group> const& groups() const { return grps; }

	/* Creates a new group and makes it current.
	 * Throws Split::InvalidNameError if a group of that
	 * name already exists, and as Split::Group::create.
	 */
	Group& create_group( std::string name
			   , std::vector<std::string> const& members
			   , Currency currency = Currency()
			   );
	/* Appends an already-built group, e.g. one loaded
	 * from storage.  */
	void restore_group(Group);
	/* Throws Split::GroupNotFoundError.  */
	void delete_group(std::string const& name);

	/* The named group, or the current group if `name`
	 * is empty (the first group if none is current).
	 * Throws Split::GroupNotFoundError.  */
	Group& get_group(std::string const& name);
	Group const& get_group(std::string const& name) const;

	bool has_current() const { return cur < grps.size(); }
	/* Pre-condition: has_current().  */
	std::string const& current_name() const {
		return grps[cur].name();
	}
	/* Throws Split::GroupNotFoundError.  */
	void select(std::string const& name);
	void clear_selection() { cur = grps.size(); }
};

}

#endif /* !defined(SPLIT_STATE_HPP) */
