#ifndef ELEMENTS_TXIN_HPP
#define ELEMENTS_TXIN_HPP

#include<cstdint>
#include<iostream>
#include<vector>
#include"Elements/TxId.hpp"
#include"Elements/Witness.hpp"

namespace Elements {

/** struct Elements::TxIn
 *
 * @brief represents an Elements transaction input.
 *
 * @desc An input contains these information:
 *
 * - Previous transaction ID.
 *   This is serialized in reverse order compared
 *   to how it is usually seen in explorer sites
 *   and used in most interfaces.
 * - Previous transaction output being spent.
 *   On the wire the top two bits of this field
 *   flag an asset issuance and a peg-in; here
 *   they are split out and `prevOut` is the bare
 *   index.
 * - `scriptSig`.
 * - `nSequence`.
 * - The `witness` for the input.
 *   Note that the serialization of a `TxIn` does
 *   ***not*** include the `witness`, it must be
 *   (de)serialized separately.
 *
 * Asset issuances are not supported: an input that
 * flags one fails to deserialize.
 */
struct TxIn {
	Elements::TxId prevTxid;
	std::uint32_t prevOut;
	bool is_pegin;
	std::vector<std::uint8_t> scriptSig;
	std::uint32_t nSequence;
	Elements::TxInWitness witness;

	TxIn() : prevOut(0xFFFFFFFF), is_pegin(false), nSequence(0xFFFFFFFF) { }
	bool operator==(TxIn const& o) const {
		return prevTxid == o.prevTxid
		    && prevOut == o.prevOut
		    && is_pegin == o.is_pegin
		    && scriptSig == o.scriptSig
		    && nSequence == o.nSequence
		    && witness == o.witness
		     ;
	}
	bool operator!=(TxIn const& o) const {
		return !(*this == o);
	}
};

}

std::ostream& operator<<(std::ostream&, Elements::TxIn const&);
std::istream& operator>>(std::istream&, Elements::TxIn&);

#endif /* !defined(ELEMENTS_TXIN_HPP) */
