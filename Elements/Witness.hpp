#ifndef ELEMENTS_WITNESS_HPP
#define ELEMENTS_WITNESS_HPP

#include<cstdint>
#include<iostream>
#include<vector>

namespace Elements {

/** struct Elements::TxInWitness
 *
 * @brief represents the witness of a particular
 * `TxIn`.
 *
 * @desc Besides the script witness stack Bitcoin
 * has, an Elements input witness carries the range
 * proofs of an asset issuance and the peg-in
 * witness stack.
 * Inputs that neither issue nor peg in leave those
 * empty.
 *
 * The script witness stack works as on Bitcoin:
 * index [0] is the stack bottom and the last item
 * is the stack top.
 * For a P2WSH the script to be executed is the
 * stack top, and its input is the rest of the
 * stack.
 */
struct TxInWitness {
	std::vector<std::uint8_t> issuanceAmountRangeproof;
	std::vector<std::uint8_t> inflationKeysRangeproof;
	std::vector<std::vector<std::uint8_t>> scriptWitness;
	std::vector<std::vector<std::uint8_t>> peginWitness;

	bool empty() const {
		return issuanceAmountRangeproof.empty()
		    && inflationKeysRangeproof.empty()
		    && scriptWitness.empty()
		    && peginWitness.empty()
		     ;
	}
	bool operator==(TxInWitness const& o) const {
		return issuanceAmountRangeproof == o.issuanceAmountRangeproof
		    && inflationKeysRangeproof == o.inflationKeysRangeproof
		    && scriptWitness == o.scriptWitness
		    && peginWitness == o.peginWitness
		     ;
	}
	bool operator!=(TxInWitness const& o) const {
		return !(*this == o);
	}
};

/** struct Elements::TxOutWitness
 *
 * @brief the proofs attached to a blinded output.
 * Both are empty for an explicit output.
 */
struct TxOutWitness {
	std::vector<std::uint8_t> surjectionProof;
	std::vector<std::uint8_t> rangeProof;

	bool empty() const {
		return surjectionProof.empty() && rangeProof.empty();
	}
	bool operator==(TxOutWitness const& o) const {
		return surjectionProof == o.surjectionProof
		    && rangeProof == o.rangeProof
		     ;
	}
	bool operator!=(TxOutWitness const& o) const {
		return !(*this == o);
	}
};

}

std::ostream& operator<<(std::ostream&, Elements::TxInWitness const&);
std::istream& operator>>(std::istream&, Elements::TxInWitness&);
std::ostream& operator<<(std::ostream&, Elements::TxOutWitness const&);
std::istream& operator>>(std::istream&, Elements::TxOutWitness&);

#endif /* !defined(ELEMENTS_WITNESS_HPP) */
