#include"Electrum/ClientIF.hpp"
#include"Electrum/create_client.hpp"
#include"Elements/Network.hpp"
#include"Elements/Tx.hpp"
#include"Ln/Preimage.hpp"
#include"Secp256k1/KeyPair.hpp"
#include"Secp256k1/Random.hpp"
#include"Swap/Detail/build_claim_tx.hpp"
#include"Swap/Detail/claim_tx_vsize.hpp"
#include"Swap/Detail/locate_utxo.hpp"
#include"Swap/Detail/sign_claim_tx.hpp"
#include"Swap/Detail/sign_refund_tx.hpp"
#include"Swap/Detail/write_snapshot.hpp"
#include"Swap/EnvIF.hpp"
#include"Swap/Error.hpp"
#include"Swap/Tx.hpp"
#include"Swap/Utxo.hpp"
#include"Util/format.hpp"

namespace {

Elements::Address parse_destination( std::string const& addr
				   , Elements::Network net
				   ) {
	try {
		return Elements::Address::parse(addr, net);
	} catch (Elements::InvalidAddress const& e) {
		throw Swap::InputError(e.what());
	}
}

}

namespace Swap {

std::string state_name(Tx::State s) {
	switch (s) {
	case Tx::Created: return "created";
	case Tx::Located: return "located";
	case Tx::Signed: return "signed";
	case Tx::Failed: return "failed";
	}
	throw std::logic_error("Swap::state_name: invalid State");
}

Tx::Tx( TxKind kind_
      , Swap::Script script_
      , std::string const& destination_
      , std::uint64_t fee_
      ) : kind(kind_)
	, script(std::move(script_))
	, destination(parse_destination( destination_
				       , script.get_config().network
				       ))
	, fee(fee_)
	, utxo_p(nullptr)
	, state(Created)
	, client_factory(&Electrum::create_client)
	, env(nullptr)
	{ }

Tx::Tx(Tx&&) =default;
Tx::~Tx() =default;

std::string Tx::logprefix(std::string const& msg) const {
	return std::string("Swap ")
	     + std::string(script.to_address()) + ": "
	     + msg
	     ;
}
void Tx::logd(std::string const& msg) const {
	if (env)
		env->logd(logprefix(msg));
}
void Tx::loge(std::string const& msg) const {
	if (env)
		env->loge(logprefix(msg));
}

void Tx::snapshot(char const* name, Elements::Tx const& tx) const {
	if (snapshot_dir.empty())
		return;
	auto path = snapshot_dir + "/" + name;
	if (!Detail::write_snapshot(path, tx))
		loge(Util::format("Could not write snapshot %s", path.c_str()));
}

std::unique_ptr<Electrum::ClientIF> Tx::make_client() const {
	try {
		return client_factory(script.get_config());
	} catch (Electrum::ApiError const& e) {
		throw NetworkError(e.what());
	}
}

bool Tx::locate() {
	auto client = make_client();
	return locate(*client);
}
bool Tx::locate(Electrum::ClientIF& client) {
	auto funding_tx = Elements::Tx();
	auto found = Detail::locate_utxo( client
					, script.lockup_scriptPubKey()
					, script.get_blinding().priv()
					, &funding_tx
					);
	if (!found) {
		logd("No funding output yet.");
		return false;
	}
	snapshot("tx.previous", funding_tx);

	utxo_p = std::move(found);
	if (state == Created)
		state = Located;
	logd(Util::format( "Found funding output %s:%u, value %llu."
			 , std::string(utxo_p->txid).c_str()
			 , (unsigned int) utxo_p->vout
			 , (unsigned long long) utxo_p->value()
			 ));
	return true;
}

void Tx::manual_utxo_update( Elements::TxId const& txid
			   , std::uint32_t vout
			   , std::uint64_t value
			   ) {
	auto asset = Elements::policy_asset(script.get_config().network);

	auto u = std::make_unique<Swap::Utxo>();
	u->txid = txid;
	u->vout = vout;
	u->secrets.asset = asset;
	u->secrets.value = value;
	u->spent_asset = Elements::ConfidentialAsset::from_asset(asset);
	u->spent_value = Elements::ConfidentialValue::from_amount(value);

	utxo_p = std::move(u);
	if (state == Created)
		state = Located;
}

bool Tx::check_utxo_value(std::uint64_t expected) const {
	return utxo_p && utxo_p->value() == expected;
}

Swap::Utxo const& Tx::utxo() const {
	if (!utxo_p)
		throw TransactionError("No utxos available yet");
	return *utxo_p;
}

Elements::Tx Tx::sign_claim( Secp256k1::KeyPair const& keys
			   , Ln::Preimage const& preimage
			   , Secp256k1::Random& rand
			   ) {
	if (kind != Claim)
		throw TransactionError("Cannot sign a claim for a refund");
	switch (state) {
	case Signed:
		throw TransactionError("Swap transaction already signed");
	case Failed:
		throw TransactionError("Swap transaction already failed");
	case Created:
	case Located:
		break;
	}

	auto const& u = utxo();
	if (fee <= u.value() && u.value() - fee < Detail::dust_value)
		logd(Util::format( "Claim output %llu is below dust."
				 , (unsigned long long) (u.value() - fee)
				 ));
	auto tx = Detail::build_claim_tx(script, u, destination, fee, rand);
	Detail::sign_claim_tx(tx, script, keys, preimage, u);
	snapshot("tx.constructed", tx);

	state = Signed;
	logd(Util::format( "Signed claim %s."
			 , std::string(tx.get_txid()).c_str()
			 ));
	return tx;
}

Elements::Tx Tx::drain( Secp256k1::KeyPair const& keys
		      , Ln::Preimage const& preimage
		      ) {
	auto rand = Secp256k1::Random();
	return drain(keys, preimage, rand);
}
Elements::Tx Tx::drain( Secp256k1::KeyPair const& keys
		      , Ln::Preimage const& preimage
		      , Secp256k1::Random& rand
		      ) {
	auto client = std::unique_ptr<Electrum::ClientIF>();
	try {
		client = make_client();
	} catch (Swap::Error const& e) {
		state = Failed;
		loge(e.what());
		throw;
	}
	return drain(*client, keys, preimage, rand);
}
Elements::Tx Tx::drain( Electrum::ClientIF& client
		      , Secp256k1::KeyPair const& keys
		      , Ln::Preimage const& preimage
		      , Secp256k1::Random& rand
		      ) {
	switch (state) {
	case Signed:
		throw TransactionError("Swap transaction already signed");
	case Failed:
		throw TransactionError("Swap transaction already failed");
	case Created:
	case Located:
		break;
	}

	try {
		return drain_core(client, keys, preimage, rand);
	} catch (Swap::Error const& e) {
		state = Failed;
		loge(e.what());
		throw;
	}
}

Elements::Tx Tx::drain_core( Electrum::ClientIF& client
			   , Secp256k1::KeyPair const& keys
			   , Ln::Preimage const& preimage
			   , Secp256k1::Random& rand
			   ) {
	locate(client);
	if (!has_utxo())
		throw TransactionError("No utxos available yet");

	switch (kind) {
	case Claim:
		return sign_claim(keys, preimage, rand);
	case Refund: {
		auto tx = Elements::Tx();
		Detail::sign_refund_tx(tx, script, keys, *utxo_p);
		/* sign_refund_tx never returns.  */
		throw TransactionError("Refund transaction signing not supported yet");
	}
	}
	throw std::logic_error("Swap::Tx::drain: invalid TxKind");
}

std::string Tx::broadcast(Elements::Tx const& signed_tx) {
	auto client = make_client();
	return broadcast(*client, signed_tx);
}
std::string Tx::broadcast( Electrum::ClientIF& client
			 , Elements::Tx const& signed_tx
			 ) {
	try {
		auto txid = client.broadcast_raw(signed_tx.to_bytes());
		logd("Broadcast " + txid);
		return txid;
	} catch (Electrum::ApiError const& e) {
		loge(std::string("Broadcast failed: ") + e.what());
		throw NetworkError(e.what());
	}
}

std::size_t Tx::estimated_vsize() const {
	return Detail::claim_tx_vsize(script, destination);
}

}
