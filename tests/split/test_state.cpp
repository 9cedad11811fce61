#undef NDEBUG
#include"Split/Error.hpp"
#include"Split/State.hpp"
#include<assert.h>

int main() {
	auto state = Split::State();
	assert(state.version() == Split::State::current_version);
	assert(state.groups().empty());
	assert(!state.has_current());

	/* No groups at all.  */
	{
		auto flag = false;
		try {
			(void) state.get_group("");
		} catch (Split::GroupNotFoundError const&) {
			flag = true;
		}
		assert(flag);
	}

	/* Created groups become current.  */
	state.create_group("Trip", {"Alice", "Bob"});
	assert(state.has_current());
	assert(state.current_name() == "Trip");
	state.create_group("Home", {"Carol", "Dave"}, Split::Currency("USD"));
	assert(state.current_name() == "Home");
	assert(state.groups().size() == 2);
	assert(state.get_group("").name() == "Home");
	assert(state.get_group("Trip").name() == "Trip");
	assert(state.get_group("Home").currency().code() == Split::Currency::USD);

	{
		auto flag = false;
		try {
			state.create_group("Trip", {"Eve"});
		} catch (Split::InvalidNameError const&) {
			flag = true;
		}
		assert(flag);
		assert(state.groups().size() == 2);
	}
	{
		auto flag = false;
		try {
			(void) state.get_group("Nowhere");
		} catch (Split::GroupNotFoundError const&) {
			flag = true;
		}
		assert(flag);
	}

	/* Selection.  */
	state.select("Trip");
	assert(state.current_name() == "Trip");
	state.get_group("").pay(100, "Alice", "Bob");
	assert(state.get_group("Trip").balance("Alice") == 100);
	state.clear_selection();
	assert(!state.has_current());
	/* Falls back to the first group.  */
	assert(state.get_group("").name() == "Trip");

	/* Deletion.  */
	state.select("Home");
	state.delete_group("Home");
	assert(state.groups().size() == 1);
	assert(!state.has_current());
	{
		auto flag = false;
		try {
			state.delete_group("Home");
		} catch (Split::GroupNotFoundError const&) {
			flag = true;
		}
		assert(flag);
	}
	{
		auto flag = false;
		try {
			state.delete_group("");
		} catch (Split::GroupNotFoundError const&) {
			flag = true;
		}
		assert(flag);
	}

	/* Restored groups do not change the selection.  */
	state.restore_group(Split::Group::create("Office", {"Zoe"}));
	assert(state.groups().size() == 2);
	assert(!state.has_current());
	state.select("Office");
	state.restore_group(Split::Group::create("Club", {"Yan"}));
	assert(state.current_name() == "Office");

	return 0;
}
