#include"Ripemd160/Hash.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<basicsecure.h>
#include<stdexcept>

namespace {

std::uint8_t const zero[20] = {0};

}

namespace Ripemd160 {

bool Hash::valid_string(std::string const& s) {
	return (s.size() == 40)
	    && (Util::Str::ishex(s))
	     ;
}
Hash::Hash(std::string const& s) {
	*this = from_vector(Util::Str::hexread(s));
}

Hash Hash::from_vector(std::vector<std::uint8_t> const& v) {
	if (v.size() != 20)
		throw Util::BacktraceException<std::invalid_argument>(
			"Ripemd160::Hash: need 20 bytes, got "
			+ std::to_string(v.size())
		);
	auto ret = Hash();
	ret.from_buffer(v.data());
	return ret;
}
std::vector<std::uint8_t> Hash::to_vector() const {
	auto ret = std::vector<std::uint8_t>(20);
	to_buffer(ret.data());
	return ret;
}

Hash::operator std::string() const {
	if (!pimpl)
		return "0000000000000000000000000000000000000000";
	return Util::Str::hexdump(pimpl->d, sizeof(pimpl->d));
}
Hash::operator bool() const {
	if (!pimpl)
		return false;
	return !basicsecure_eq(zero, pimpl->d, 20);
}
bool Hash::operator==(Hash const& i) const {
	auto a = pimpl ? pimpl->d : zero;
	auto b = i.pimpl ? i.pimpl->d : zero;
	return basicsecure_eq(a, b, 20);
}

}
