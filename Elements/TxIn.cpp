#include"Bitcoin/le.hpp"
#include"Bitcoin/varbytes.hpp"
#include"Elements/TxIn.hpp"

namespace {

auto constexpr issuance_flag = std::uint32_t(1) << 31;
auto constexpr pegin_flag = std::uint32_t(1) << 30;
auto constexpr index_mask = std::uint32_t(0x3FFFFFFF);

}

std::ostream& operator<<(std::ostream& os, Elements::TxIn const& v) {
	auto n = v.prevOut;
	if (n != 0xFFFFFFFF && v.is_pegin)
		n |= pegin_flag;
	os << v.prevTxid
	   << Bitcoin::le(n)
	   << Bitcoin::varbytes(v.scriptSig)
	   << Bitcoin::le(v.nSequence)
	    ;
	return os;
}
std::istream& operator>>(std::istream& is, Elements::TxIn& v) {
	is >> v.prevTxid
	   >> Bitcoin::le(v.prevOut)
	    ;
	v.is_pegin = false;
	/* Coinbase inputs use all-ones and carry no flags.  */
	if (v.prevOut != 0xFFFFFFFF) {
		if (v.prevOut & issuance_flag) {
			is.setstate(std::ios_base::failbit);
			return is;
		}
		v.is_pegin = (v.prevOut & pegin_flag) != 0;
		v.prevOut &= index_mask;
	}
	is >> Bitcoin::varbytes(v.scriptSig)
	   >> Bitcoin::le(v.nSequence)
	    ;
	return is;
}
