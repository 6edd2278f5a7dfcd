#include"Electrum/ClientIF.hpp"
#include"Elements/Tx.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Swap/Detail/locate_utxo.hpp"
#include"Swap/Error.hpp"
#include"Swap/Utxo.hpp"
#include<algorithm>

namespace Swap { namespace Detail {

int find_lockup_outnum( Elements::Tx const& tx
		      , std::vector<std::uint8_t> const& scriptPubKey
		      ) {
	auto it = std::find_if( tx.outputs.begin(), tx.outputs.end()
			      , [&scriptPubKey](Elements::TxOut const& out) {
		return out.scriptPubKey == scriptPubKey;
	});
	if (it == tx.outputs.end())
		return -1;
	return it - tx.outputs.begin();
}

std::unique_ptr<Swap::Utxo>
locate_utxo( Electrum::ClientIF& client
	   , std::vector<std::uint8_t> const& scriptPubKey
	   , Secp256k1::PrivKey const& blinding_key
	   , Elements::Tx* funding_tx
	   ) {
	auto history = std::vector<Electrum::HistoryEntry>();
	auto raw = std::vector<std::uint8_t>();
	try {
		history = client.get_history(scriptPubKey);
		if (history.empty())
			return nullptr;
		raw = client.get_raw_transaction(history[0].txid);
	} catch (Electrum::ApiError const& e) {
		throw NetworkError(e.what());
	}

	auto tx = Elements::Tx();
	try {
		tx = Elements::Tx::from_bytes(raw);
	} catch (Elements::TxParseError const& e) {
		throw TransactionError(e.what());
	}
	if (tx.get_txid() != history[0].txid)
		throw TransactionError( "Server returned transaction "
				      + std::string(tx.get_txid())
				      + " for "
				      + std::string(history[0].txid)
				      );
	if (funding_tx)
		*funding_tx = tx;

	auto outnum = find_lockup_outnum(tx, scriptPubKey);
	if (outnum < 0)
		return nullptr;

	auto const& out = tx.outputs[outnum];
	auto ret = std::make_unique<Swap::Utxo>();
	ret->txid = history[0].txid;
	ret->vout = std::uint32_t(outnum);
	ret->spent_asset = out.asset;
	ret->spent_value = out.value;
	try {
		ret->secrets = Elements::Blinder::unblind(blinding_key, out);
	} catch (Elements::BlindingFailed const& e) {
		throw TransactionError(e.what());
	}
	return ret;
}

}}
