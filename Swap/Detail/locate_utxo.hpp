#ifndef SWAP_DETAIL_LOCATE_UTXO_HPP
#define SWAP_DETAIL_LOCATE_UTXO_HPP

#include<cstdint>
#include<memory>
#include<vector>

namespace Electrum { class ClientIF; }
namespace Elements { struct Tx; }
namespace Secp256k1 { class PrivKey; }
namespace Swap { struct Utxo; }

namespace Swap { namespace Detail {

/** Swap::Detail::find_lockup_outnum
 *
 * @brief index of the first output of `tx` paying
 * to `scriptPubKey`, or -1.
 */
int find_lockup_outnum( Elements::Tx const& tx
		      , std::vector<std::uint8_t> const& scriptPubKey
		      );

/** Swap::Detail::locate_utxo
 *
 * @brief finds and unblinds the output funding
 * `scriptPubKey`.
 *
 * @desc Only the first transaction in the script's
 * history is examined.
 * Returns null if the history is empty or that
 * transaction does not pay to the script.
 * If `funding_tx` is non-null the fetched
 * transaction is written there.
 *
 * Server failures throw `Swap::NetworkError`; an
 * undecodable transaction or an output that cannot
 * be unblinded throws `Swap::TransactionError`.
 */
std::unique_ptr<Swap::Utxo>
locate_utxo( Electrum::ClientIF& client
	   , std::vector<std::uint8_t> const& scriptPubKey
	   , Secp256k1::PrivKey const& blinding_key
	   , Elements::Tx* funding_tx = nullptr
	   );

}}

#endif /* !defined(SWAP_DETAIL_LOCATE_UTXO_HPP) */
