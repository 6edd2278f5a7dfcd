#undef NDEBUG
#include"Util/format.hpp"
#include<assert.h>
#include<string>

int main() {
	assert(Util::format("foo") == "foo");
	assert(Util::format("%s", "") == "");
	assert(Util::format("foo %d", 42) == "foo 42");
	assert(Util::format("foo %d %0.1f", 42, double(0.0)) == "foo 42 0.0");
	assert(Util::format("foo %s batz", "bar") == "foo bar batz");
	assert( Util::format("%s:%u", "deadbeef", 7u)
	     == "deadbeef:7"
	      );
	assert( Util::format("value %llu", (unsigned long long) 18446744073709551615ULL)
	     == "value 18446744073709551615"
	      );

	/* Longer than any fixed first guess.  */
	auto big = std::string(1000, 'x');
	assert(Util::format("[%s]", big.c_str()) == "[" + big + "]");

	return 0;
}
