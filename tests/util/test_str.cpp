#undef NDEBUG
#include"Util/Str.hpp"
#include<assert.h>

int main() {
	assert(Util::Str::hexbyte(0x00) == "00");
	assert(Util::Str::hexbyte(0x0a) == "0a");
	assert(Util::Str::hexbyte(0xff) == "ff");

	auto v = Util::Str::hexread("00ff10Ab");
	assert(v.size() == 4);
	assert(v[0] == 0x00);
	assert(v[1] == 0xff);
	assert(v[2] == 0x10);
	assert(v[3] == 0xab);
	assert(Util::Str::hexdump(v) == "00ff10ab");
	assert(Util::Str::hexdump(std::vector<std::uint8_t>()) == "");
	assert(Util::Str::hexread("").empty());

	auto thrown = false;
	try {
		Util::Str::hexread("abc");
	} catch (Util::Str::HexParseFailure const&) {
		thrown = true;
	}
	assert(thrown);
	thrown = false;
	try {
		Util::Str::hexread("zz");
	} catch (Util::Str::HexParseFailure const&) {
		thrown = true;
	}
	assert(thrown);

	assert(Util::Str::ishex("0123456789abcdefABCDEF"));
	assert(!Util::Str::ishex("012"));
	assert(!Util::Str::ishex("0g"));

	assert(Util::Str::trim("  tlq1 \n") == "tlq1");
	assert(Util::Str::trim(" \t ") == "");
	assert(Util::Str::trim("x") == "x");

	return 0;
}
