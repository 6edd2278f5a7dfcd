#include"Sha256/Hash.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<basicsecure.h>
#include<stdexcept>

namespace {

std::uint8_t const zero[32] = {0};

}

namespace Sha256 {

bool Hash::valid_string(std::string const& s) {
	return s.size() == 64 && Util::Str::ishex(s);
}
Hash::Hash(std::string const& s) {
	auto bytes = Util::Str::hexread(s);
	if (bytes.size() != 32)
		throw Util::BacktraceException<std::invalid_argument>("Hashes must be 32 bytes.");
	from_buffer(&bytes[0]);
}

Hash::operator std::string() const {
	if (!pimpl)
		return Util::Str::hexdump(zero, 32);
	return Util::Str::hexdump(pimpl->d, 32);
}

std::string Hash::reversed_hex() const {
	std::uint8_t buf[32];
	to_buffer(buf);
	std::reverse(buf, buf + 32);
	return Util::Str::hexdump(buf, 32);
}
Hash Hash::from_reversed_hex(std::string const& s) {
	auto bytes = Util::Str::hexread(s);
	if (bytes.size() != 32)
		throw Util::BacktraceException<std::invalid_argument>("Hashes must be 32 bytes.");
	std::reverse(bytes.begin(), bytes.end());
	auto ret = Hash();
	ret.from_buffer(&bytes[0]);
	return ret;
}

Hash::operator bool() const {
	if (!pimpl)
		return false;

	return !basicsecure_eq(zero, pimpl->d, 32);
}
bool Hash::operator==(Hash const& i) const {
	auto a = pimpl ? pimpl->d : zero;
	auto b = i.pimpl ? i.pimpl->d : zero;
	return basicsecure_eq(a, b, 32);
}

}
