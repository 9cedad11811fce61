#undef NDEBUG
#include"Split/Allocator.hpp"
#include"Split/Error.hpp"
#include<assert.h>

namespace {

typedef std::vector<std::string> Strings;

auto const four = Strings{"Alice", "Bob", "Charly", "Django"};

Split::ErrorKind alloc_error( Split::Money total
			    , Strings const& members
			    , Strings const& from
			    , Strings const& to
			    , bool balance_rest = false
			    ) {
	try {
		(void) Split::split_into_transaction( total, members
						    , from, to, balance_rest
						    );
	} catch (Split::Error const& e) {
		return e.kind();
	}
	assert(false);
	return Split::InvalidSemantic;
}

}

int main() {
	/* One payer, everyone shares.  */
	{
		auto a = Split::split_into_transaction( 12000, four
						      , {"Alice"}, {}, false
						      );
		assert(a.change.size() == 4);
		assert(a.change["Alice"] == 9000);
		assert(a.change["Bob"] == -3000);
		assert(a.change["Charly"] == -3000);
		assert(a.change["Django"] == -3000);
		assert(Split::change_sum(a.change) == 0);
		assert(a.from.size() == 1);
		assert(a.from[0] == Split::Target::wildcard("Alice"));
		assert(a.to.empty());
	}

	/* Someone named in --to pays only their part.  */
	{
		auto a = Split::split_into_transaction( 13000, four
						      , {"Bob"}, {"Alice:10"}
						      , false
						      );
		assert(a.change["Alice"] == -1000);
		assert(a.change["Bob"] == 9000);
		assert(a.change["Charly"] == -4000);
		assert(a.change["Django"] == -4000);
		assert(a.to.size() == 1);
		assert(a.to[0] == Split::Target::exact("Alice", 1000));
	}

	/* ... unless they also share the rest.  */
	{
		auto a = Split::split_into_transaction( 14000, four
						      , {"Alice"}, {"Bob:20"}
						      , true
						      );
		assert(a.change["Alice"] == 11000);
		assert(a.change["Bob"] == -5000);
		assert(a.change["Charly"] == -3000);
		assert(a.change["Django"] == -3000);
	}
	{
		auto a = Split::split_into_transaction( 14000, four
						      , {"Alice"}, {"Bob:20"}
						      , false
						      );
		assert(a.change["Alice"] == 10000);
		assert(a.change["Bob"] == -2000);
		assert(a.change["Charly"] == -4000);
		assert(a.change["Django"] == -4000);
	}

	/* Amounts in minor units.  */
	{
		auto a = Split::split_into_transaction( 120, four
						      , {"Alice"}, {}, false
						      );
		assert((a.change == Split::Change{ {"Alice", 90}, {"Bob", -30}
						 , {"Charly", -30}, {"Django", -30}
						 }));
	}
	{
		auto a = Split::split_into_transaction( 130, four
						      , {"Bob"}, {"Alice:0,1"}
						      , false
						      );
		assert((a.change == Split::Change{ {"Alice", -10}, {"Bob", 90}
						 , {"Charly", -40}, {"Django", -40}
						 }));
	}
	{
		auto to = Strings{"Alice:0,1", "Charly:0.1"};
		auto a = Split::split_into_transaction( 140, four
						      , {"Bob"}, to, false
						      );
		assert((a.change == Split::Change{ {"Alice", -10}, {"Bob", 80}
						 , {"Charly", -10}, {"Django", -60}
						 }));
		auto b = Split::split_into_transaction( 140, four
						      , {"Bob"}, to, true
						      );
		assert((b.change == Split::Change{ {"Alice", -40}, {"Bob", 110}
						 , {"Charly", -40}, {"Django", -30}
						 }));
	}

	/* Leftover units go to the first members.  */
	{
		auto a = Split::split_into_transaction( 100
						      , {"A", "B", "C"}
						      , {"A"}, {}, false
						      );
		assert(a.change["A"] == 66);
		assert(a.change["B"] == -33);
		assert(a.change["C"] == -33);
	}

	/* Wildcard payers cover what explicit payers did
	 * not.  */
	{
		auto a = Split::split_into_transaction( 1000
						      , {"A", "B", "C"}
						      , {"A:3", "B"}, {}, false
						      );
		assert(a.change["A"] == -34);
		assert(a.change["B"] == 367);
		assert(a.change["C"] == -333);
		assert(Split::change_sum(a.change) == 0);
	}
	{
		auto a = Split::split_into_transaction( 101
						      , {"A", "B"}
						      , {"B", "A"}, {}, false
						      );
		/* A: 51 - 51, B: 50 - 50.  */
		assert(a.change["A"] == 0);
		assert(a.change["B"] == 0);
	}

	/* Everyone named in --to, amounts cover the total.  */
	{
		auto a = Split::split_into_transaction( 1000
						      , {"A", "B"}
						      , {"A"}, {"A:5", "B:5"}
						      , false
						      );
		assert(a.change["A"] == 500);
		assert(a.change["B"] == -500);
	}

	/* Rejections.  */
	assert(alloc_error(1000, four, {}, {}) == Split::InvalidSemantic);
	assert(alloc_error(1000, four, {"Alice:5"}, {}) == Split::InvalidSemantic);
	assert(alloc_error(1000, four, {"Alice"}, {"Bob"}) == Split::InvalidTargetFormat);
	assert(alloc_error(1000, four, {"Zed"}, {}) == Split::MemberNotFound);
	assert(alloc_error(1000, four, {"Alice"}, {"Zed:1"}) == Split::MemberNotFound);
	assert(alloc_error(1000, four, {"Alice", "Alice"}, {}) == Split::InvalidName);
	assert(alloc_error(1000, four, {"Alice"}, {"Bob:1", "Bob:2"}) == Split::InvalidName);
	assert(alloc_error(1000, four, {"Alice:20"}, {}) == Split::InvalidSemantic);
	assert(alloc_error(1000, {"A", "B"}, {"A"}, {"A:3", "B:3"}) == Split::InvalidSemantic);
	assert(alloc_error(1000, four, {"Al:ice:3"}, {}) == Split::InvalidTargetFormat);
	assert(alloc_error(1000, four, {"Alice:x"}, {}) == Split::InvalidNumberFormat);

	/* Large amounts that are each in range, but whose
	 * difference is not.  */
	assert(alloc_error( Split::Money(9000000000000000000)
			  , {"A", "B", "C"}
			  , {"A:50000000000000000", "B"}
			  , {"C:-50000000000000000"}
			  ) == Split::InvalidNumberFormat);
	assert(alloc_error( Split::Money(9000000000000000000)
			  , {"A", "B", "C"}
			  , {"A:50000000000000000", "B:50000000000000000", "C"}
			  , {}
			  ) == Split::InvalidNumberFormat);
	/* Near the limit but representable.  */
	{
		auto a = Split::split_into_transaction( Split::Money(9000000000000000000)
						      , {"A", "B"}
						      , {"A"}, {}, false
						      );
		assert(a.change["A"] == Split::Money(4500000000000000000));
		assert(a.change["B"] == -Split::Money(4500000000000000000));
	}

	return 0;
}
