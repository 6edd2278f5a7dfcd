#ifndef BITCOIN_HASH160_HPP
#define BITCOIN_HASH160_HPP

#include<cstdint>
#include<vector>

namespace Ripemd160 { class Hash; }

namespace Bitcoin {

/** Bitcoin::hash160
 *
 * @brief RIPEMD160 of the SHA256 of the input.
 *
 * @desc The swap hashlock is this over the
 * preimage, and the P2SH-P2WSH address commits
 * to this over the nested P2WSH scriptPubKey.
 */
Ripemd160::Hash hash160(void const* p, std::size_t len);
Ripemd160::Hash hash160(std::vector<std::uint8_t> const&);

}

#endif /* BITCOIN_HASH160_HPP */
