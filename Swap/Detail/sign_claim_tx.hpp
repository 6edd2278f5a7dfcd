#ifndef SWAP_DETAIL_SIGN_CLAIM_TX_HPP
#define SWAP_DETAIL_SIGN_CLAIM_TX_HPP

namespace Elements { struct Tx; }
namespace Ln { class Preimage; }
namespace Secp256k1 { class KeyPair; }
namespace Swap { class Script; }
namespace Swap { struct Utxo; }

namespace Swap { namespace Detail {

/** Swap::Detail::sign_claim_tx
 *
 * @brief signs input 0 of `tx` along the hashlock
 * branch of `script`, and fills in its witness.
 *
 * @desc The signature is low-R ECDSA over the
 * segwit v0 sighash with `SIGHASH_ALL`, committing
 * to the funding output's on-chain value.
 * The witness is
 * `[<empty>, <signature>, <preimage>, <script>]`.
 * A submarine lockup is P2SH-wrapped, so its
 * `scriptSig` also gets the push of the P2WSH
 * program.
 *
 * Throws `Swap::InputError` if the preimage is
 * absent or does not match the hashlock, or if
 * `keys` is not the receiver key.
 */
void sign_claim_tx( Elements::Tx& tx
		  , Swap::Script const& script
		  , Secp256k1::KeyPair const& keys
		  , Ln::Preimage const& preimage
		  , Swap::Utxo const& utxo
		  );

}}

#endif /* !defined(SWAP_DETAIL_SIGN_CLAIM_TX_HPP) */
