#include"Bitcoin/varbytes.hpp"
#include"Bitcoin/varint.hpp"
#include"Elements/Witness.hpp"

namespace {

/* No stack is ever this deep.  */
auto constexpr max_stack_items = std::uint64_t(10000);

void write_stack( std::ostream& os
		, std::vector<std::vector<std::uint8_t>> const& stack
		) {
	os << Bitcoin::varint(stack.size());
	for (auto const& w : stack)
		os << Bitcoin::varbytes(w);
}
void read_stack( std::istream& is
	       , std::vector<std::vector<std::uint8_t>>& stack
	       ) {
	auto len = std::uint64_t();
	is >> Bitcoin::varint(len);
	if (!is || len > max_stack_items) {
		is.setstate(std::ios_base::failbit);
		stack.clear();
		return;
	}
	stack.resize(std::size_t(len));
	for (auto& w : stack)
		is >> Bitcoin::varbytes(w);
}

}

std::ostream& operator<<(std::ostream& os, Elements::TxInWitness const& v) {
	os << Bitcoin::varbytes(v.issuanceAmountRangeproof)
	   << Bitcoin::varbytes(v.inflationKeysRangeproof)
	    ;
	write_stack(os, v.scriptWitness);
	write_stack(os, v.peginWitness);
	return os;
}
std::istream& operator>>(std::istream& is, Elements::TxInWitness& v) {
	is >> Bitcoin::varbytes(v.issuanceAmountRangeproof)
	   >> Bitcoin::varbytes(v.inflationKeysRangeproof)
	    ;
	read_stack(is, v.scriptWitness);
	read_stack(is, v.peginWitness);
	return is;
}

std::ostream& operator<<(std::ostream& os, Elements::TxOutWitness const& v) {
	return os << Bitcoin::varbytes(v.surjectionProof)
		  << Bitcoin::varbytes(v.rangeProof)
		   ;
}
std::istream& operator>>(std::istream& is, Elements::TxOutWitness& v) {
	return is >> Bitcoin::varbytes(v.surjectionProof)
		  >> Bitcoin::varbytes(v.rangeProof)
		   ;
}
