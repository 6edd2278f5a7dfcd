#ifndef SWAP_UTXO_HPP
#define SWAP_UTXO_HPP

#include"Elements/Blinder.hpp"
#include"Elements/Confidential.hpp"
#include"Elements/TxId.hpp"
#include<cstdint>

namespace Swap {

/** struct Swap::Utxo
 *
 * @brief the funding output of a swap, with what
 * unblinding it revealed.
 *
 * @desc `spent_value` is the value field exactly as
 * it appears on chain, a commitment if the output
 * was blinded; it is what the claim signature
 * commits to.
 */
struct Utxo {
	Elements::TxId txid;
	std::uint32_t vout;
	Elements::TxOutSecrets secrets;
	Elements::ConfidentialAsset spent_asset;
	Elements::ConfidentialValue spent_value;

	Utxo() : vout(0) { }

	std::uint64_t value() const { return secrets.value; }
	Elements::AssetId const& asset() const { return secrets.asset; }
};

}

#endif /* !defined(SWAP_UTXO_HPP) */
