#ifndef SWAP_DETAIL_BUILD_CLAIM_TX_HPP
#define SWAP_DETAIL_BUILD_CLAIM_TX_HPP

#include<cstdint>

namespace Elements { class Address; }
namespace Elements { struct Tx; }
namespace Secp256k1 { class Random; }
namespace Swap { class Script; }
namespace Swap { struct Utxo; }

namespace Swap { namespace Detail {

/** Swap::Detail::build_claim_tx
 *
 * @brief creates the unsigned claim transaction
 * sweeping the swap output to `destination`,
 * less `fee`.
 *
 * @desc The payment output is blinded to the
 * destination's blinding key; the fee output is
 * explicit, in the network's policy asset.
 * `nLockTime` is the swap timelock and the single
 * input is final.
 *
 * Throws `Swap::TransactionError` if `fee` exceeds
 * the funding value, before anything is blinded,
 * or if blinding fails.
 */
Elements::Tx
build_claim_tx( Swap::Script const& script
	      , Swap::Utxo const& utxo
	      , Elements::Address const& destination
	      , std::uint64_t fee
	      , Secp256k1::Random& rand
	      );

}}

#endif /* !defined(SWAP_DETAIL_BUILD_CLAIM_TX_HPP) */
