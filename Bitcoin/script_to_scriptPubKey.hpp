#ifndef BITCOIN_SCRIPT_TO_SCRIPTPUBKEY_HPP
#define BITCOIN_SCRIPT_TO_SCRIPTPUBKEY_HPP

#include<cstdint>
#include<vector>

namespace Bitcoin {

/** Bitcoin::p2wsh_scriptPubKey
 *
 * @brief `OP_0 <sha256(witnessScript)>`, the
 * segwit v0 script-hash locking script.
 */
std::vector<std::uint8_t>
p2wsh_scriptPubKey(std::vector<std::uint8_t> const& witnessScript);

/** Bitcoin::p2sh_scriptPubKey
 *
 * @brief `OP_HASH160 <hash160(redeemScript)> OP_EQUAL`.
 * For P2SH-wrapped segwit the redeemScript is the
 * P2WSH locking script.
 */
std::vector<std::uint8_t>
p2sh_scriptPubKey(std::vector<std::uint8_t> const& redeemScript);

}

#endif /* !defined(BITCOIN_SCRIPT_TO_SCRIPTPUBKEY_HPP) */
