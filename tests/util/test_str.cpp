#undef NDEBUG
#include"Util/Str.hpp"
#include<assert.h>

int main() {
	assert(Util::Str::trim("  foo \t\n") == "foo");
	assert(Util::Str::trim("   ") == "");
	assert(Util::Str::trim("") == "");
	assert(Util::Str::trim("a b") == "a b");
	/* Bytes above 0x7F are never whitespace.  */
	assert(Util::Str::trim(" 5\xe2\x82\xac ") == "5\xe2\x82\xac");
	assert(Util::Str::trim("\xa0x\xa0") == "\xa0x\xa0");

	{
		auto parts = Util::Str::split("Alice:12.50", ':');
		assert(parts.size() == 2);
		assert(parts[0] == "Alice");
		assert(parts[1] == "12.50");
	}
	{
		auto parts = Util::Str::split("", ':');
		assert(parts.size() == 1);
		assert(parts[0] == "");
	}
	{
		auto parts = Util::Str::split(":a::", ':');
		assert(parts.size() == 4);
		assert(parts[0] == "");
		assert(parts[1] == "a");
		assert(parts[2] == "");
		assert(parts[3] == "");
	}

	assert(Util::Str::replace_all("12,50", ',', '.') == "12.50");
	assert(Util::Str::replace_all("none", ',', '.') == "none");

	assert(Util::Str::fmt("%d-%s", 42, "x") == "42-x");
	/* Longer than the initial buffer.  */
	auto longer = std::string(200, 'z');
	assert(Util::Str::fmt("<%s>", longer.c_str()) == "<" + longer + ">");

	return 0;
}
