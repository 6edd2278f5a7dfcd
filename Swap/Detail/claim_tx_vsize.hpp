#ifndef SWAP_DETAIL_CLAIM_TX_VSIZE_HPP
#define SWAP_DETAIL_CLAIM_TX_VSIZE_HPP

#include<cstddef>
#include<cstdint>

namespace Elements { class Address; }
namespace Swap { class Script; }

namespace Swap { namespace Detail {

/* Smallest output value relayed by default.  */
std::uint64_t const dust_value = 546;
/* Surjection proof, as estimated by wallets.  */
std::size_t const default_surjectionproof_size = 135;
/* 52-bit range proof with exponent 0.  */
std::size_t const default_rangeproof_size = 4174;

/** Swap::Detail::claim_tx_vsize
 *
 * @brief the virtual size a signed claim of
 * `script` to `destination` will have.
 *
 * @desc Computed by serializing a claim of the
 * right shape with placeholder proofs of the
 * default sizes and a 72-byte signature, so the
 * estimate is never below the real size.
 */
std::size_t claim_tx_vsize( Swap::Script const& script
			  , Elements::Address const& destination
			  );

}}

#endif /* !defined(SWAP_DETAIL_CLAIM_TX_VSIZE_HPP) */
