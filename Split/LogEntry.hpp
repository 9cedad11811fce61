#ifndef SPLIT_LOGENTRY_HPP
#define SPLIT_LOGENTRY_HPP

#include"Split/Change.hpp"
#include"Split/Money.hpp"
#include"Split/Settlement.hpp"
#include"Split/Target.hpp"
#include<string>
#include<vector>

namespace Split {

/** struct Split::LogEntry
 *
 * @brief one applied command in the log of a group,
 * together with the exact balance change it caused.
 *
 * @desc Which of the command fields are meaningful
 * depends on `command`:
 *
 * - `SplitCommand`: `name`, `amount`, `from`, `to`,
 *   `balance_rest`.
 * - `PayCommand`: `amount`, `payer`, `payee`.
 * - `SettleCommand`: `settlements`.
 *
 * Undoing an entry applies `reversed_change()`.
 */
struct LogEntry {
	enum Command {
		SplitCommand,
		PayCommand,
		SettleCommand
	};

	Command command;

	std::string name;
	Money amount;
	std::vector<Target> from;
	std::vector<Target> to;
	bool balance_rest;

	std::string payer;
	std::string payee;

	std::vector<Settlement> settlements;

	Change change;

	LogEntry() : command(PayCommand), amount(0), balance_rest(false) { }

	static
	LogEntry split( std::string name, Money amount
		      , std::vector<Target> from, std::vector<Target> to
		      , bool balance_rest
		      , Change change
		      );
	static
	LogEntry pay( Money amount
		    , std::string payer, std::string payee
		    , Change change
		    );
	static
	LogEntry settle( std::vector<Settlement> settlements
		       , Change change
		       );

	Change reversed_change() const { return reversed(change); }

	/* One-line description, amounts in the given
	 * currency.  */
	std::string to_string(Currency const&) const;
};

/* "split", "pay", "settle".  */
char const* command_name(LogEntry::Command);
/* Inverse of `command_name`.
 * Throws std::invalid_argument on unknown names.  */
LogEntry::Command command_from_name(std::string const&);

}

#endif /* !defined(SPLIT_LOGENTRY_HPP) */
