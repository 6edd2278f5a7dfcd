#ifndef SWAP_DETAIL_SIGN_REFUND_TX_HPP
#define SWAP_DETAIL_SIGN_REFUND_TX_HPP

namespace Elements { struct Tx; }
namespace Secp256k1 { class KeyPair; }
namespace Swap { class Script; }
namespace Swap { struct Utxo; }

namespace Swap { namespace Detail {

/** Swap::Detail::sign_refund_tx
 *
 * @brief would sign `tx` along the timelock branch
 * of `script`.
 *
 * @desc Not supported: always throws
 * `Swap::TransactionError`, leaving `tx` alone.
 */
void sign_refund_tx( Elements::Tx& tx
		   , Swap::Script const& script
		   , Secp256k1::KeyPair const& keys
		   , Swap::Utxo const& utxo
		   );

}}

#endif /* !defined(SWAP_DETAIL_SIGN_REFUND_TX_HPP) */
