#ifndef ELEMENTS_TXOUT_HPP
#define ELEMENTS_TXOUT_HPP

#include<cstdint>
#include<iostream>
#include<vector>
#include"Elements/Confidential.hpp"
#include"Elements/Witness.hpp"

namespace Elements {

/** struct Elements::TxOut
 *
 * @brief represents an output of an Elements
 * transaction.
 *
 * @desc This includes an asset, an amount, a
 * nonce and a script.
 * As with `TxIn`, the `witness` (the proofs of a
 * blinded output) is not part of the serialization
 * of a `TxOut`.
 *
 * An output with an empty `scriptPubKey` is the
 * transaction fee.
 */
struct TxOut {
	Elements::ConfidentialAsset asset;
	Elements::ConfidentialValue value;
	Elements::ConfidentialNonce nonce;
	std::vector<std::uint8_t> scriptPubKey;
	Elements::TxOutWitness witness;

	bool is_fee() const {
		return scriptPubKey.empty()
		    && asset.is_explicit()
		    && value.is_explicit()
		     ;
	}

	bool operator==(TxOut const& o) const {
		return asset == o.asset
		    && value == o.value
		    && nonce == o.nonce
		    && scriptPubKey == o.scriptPubKey
		    && witness == o.witness
		     ;
	}
	bool operator!=(TxOut const& o) const {
		return !(*this == o);
	}
};

}

std::ostream& operator<<(std::ostream&, Elements::TxOut const&);
std::istream& operator>>(std::istream&, Elements::TxOut&);

#endif /* !defined(ELEMENTS_TXOUT_HPP) */
