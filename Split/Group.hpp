#ifndef SPLIT_GROUP_HPP
#define SPLIT_GROUP_HPP

#include"Split/Change.hpp"
#include"Split/LogEntry.hpp"
#include"Split/Money.hpp"
#include"Split/Settlement.hpp"
#include<cstddef>
#include<map>
#include<string>
#include<vector>

namespace Split {

/** class Split::Group
 *
 * @brief a named set of members with running balances,
 * plus the log of every change applied to them.
 *
 * @desc Members are iterated in ascending name order,
 * which is also the order in which leftover units of
 * equal splits are handed out.
 *
 * Every mutating operation either succeeds completely
 * or throws before touching any balance or the log.
 */
class Group {
private:
	std::string nm;
	Currency cur;
	std::map<std::string, Money> mems;
	std::vector<LogEntry> lg;

	std::size_t resolve_index(std::size_t const* index) const;

public:
	Group() =default;
	Group(Group const&) =default;
	Group(Group&&) =default;
	Group& operator=(Group const&) =default;
	Group& operator=(Group&&) =default;
	~Group() =default;

	/** Split::Group::create
	 *
	 * @brief creates a group whose members all start
	 * with a balance of 0.
	 *
	 * @desc Throws Split::InvalidNameError if the group
	 * name or any member name is malformed or a member
	 * is listed twice, and Split::InvalidSemanticError
	 * if there are no members.
	 */
	static
	Group create( std::string name
		    , std::vector<std::string> const& members
		    , Currency currency = Currency()
		    );

	/* Rebuilds a group as it was saved, without
	 * re-validating.  */
	static
	Group restore( std::string name
		     , Currency currency
		     , std::map<std::string, Money> members
		     , std::vector<LogEntry> log
		     );

	std::string const& name() const { return nm; }
	Currency const& currency() const { return cur; }
	std::map<std::string, Money> const& members() const { return mems; }
	std::vector<LogEntry> const& log() const { return lg; }

	bool has_member(std::string const& m) const {
		return mems.count(m) != 0;
	}
	/* Throws Split::MemberNotFoundError.  */
	Money balance(std::string const& member) const;
	std::vector<std::string> member_names() const;

	/* Adds `change` to the balances.
	 * Throws Split::MemberNotFoundError, without
	 * changing anything, if it names a non-member, and
	 * Split::InvalidNumberFormatError if a balance would
	 * overflow.  */
	void apply(Change const& change);
	/* Appends to the log.  */
	void log(LogEntry entry);

	/* Log access; without an index, the last entry.
	 * Throws Split::LogEntryNotFoundError if the log is
	 * empty or the index is past its end.  */
	LogEntry const& get_log() const;
	LogEntry const& get_log(std::size_t index) const;
	LogEntry remove_log();
	LogEntry remove_log(std::size_t index);

	/* Reverses the change of a log entry and removes
	 * it from the log; without an index, the last
	 * entry.
	 * Returns the removed entry.  */
	LogEntry undo();
	LogEntry undo(std::size_t index);

	/* Records that `from` paid `amount` directly to
	 * `to`: `from` gains `amount`, `to` loses it.  */
	void pay(Money amount, std::string const& from, std::string const& to);

	/* Allocates an expense (see
	 * Split::split_into_transaction), applies and logs
	 * it, and returns the applied change.  */
	Change split( Money amount
		    , std::vector<std::string> const& from
		    , std::vector<std::string> const& to
		    , std::string name
		    , bool balance_rest
		    );

	/* Plans payments that would zero every balance.  */
	std::vector<Settlement> plan_settlement() const;
	/* Applies the planned payments as one log entry.  */
	void apply_settlement(std::vector<Settlement> const&);

	/** Split::Group::add
	 *
	 * @brief adds new members with a balance of 0.
	 *
	 * @desc Names that are malformed or already members
	 * are skipped and reported together in a single
	 * Split::InvalidNameError, after the valid names
	 * were added.
	 */
	void add(std::vector<std::string> const& members);
	/** Split::Group::remove
	 *
	 * @brief removes members.
	 *
	 * @desc Only members with a zero balance are removed
	 * unless `force` is set.
	 * Names that could not be removed are reported
	 * together in a single Split::InvalidNameError,
	 * after the others were removed.
	 */
	void remove(std::vector<std::string> const& members, bool force);

	/* Human-readable member balances.  */
	std::string stat() const;
	/* Human-readable numbered log.  */
	std::string list() const;
};

}

#endif /* !defined(SPLIT_GROUP_HPP) */
