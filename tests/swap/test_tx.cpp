#undef NDEBUG
#include"Electrum/ClientIF.hpp"
#include"Electrum/Config.hpp"
#include"Elements/Address.hpp"
#include"Elements/Blinder.hpp"
#include"Elements/Network.hpp"
#include"Elements/Tx.hpp"
#include"Ln/Preimage.hpp"
#include"Secp256k1/KeyPair.hpp"
#include"Secp256k1/Random.hpp"
#include"Swap/Error.hpp"
#include"Swap/Script.hpp"
#include"Swap/StreamEnv.hpp"
#include"Swap/Tx.hpp"
#include"Swap/Utxo.hpp"
#include<assert.h>
#include<fstream>
#include<functional>
#include<map>
#include<memory>
#include<sstream>
#include<stdlib.h>
#include<unistd.h>

namespace {

auto const testnet = Electrum::Config::default_liquid_testnet();

class FakeClient : public Electrum::ClientIF {
public:
	std::map< std::vector<std::uint8_t>
		, std::vector<Electrum::HistoryEntry>
		> histories;
	std::map<std::string, std::vector<std::uint8_t>> raws;
	std::string broadcast_error;
	std::string history_error;
	std::vector<std::vector<std::uint8_t>> broadcasts;

	std::vector<Electrum::HistoryEntry>
	get_history(std::vector<std::uint8_t> const& spk) override {
		if (!history_error.empty())
			throw Electrum::ApiError(history_error);
		auto it = histories.find(spk);
		if (it == histories.end())
			return {};
		return it->second;
	}
	std::vector<std::uint8_t>
	get_raw_transaction(Elements::TxId const& txid) override {
		auto it = raws.find(std::string(txid));
		if (it == raws.end())
			throw Electrum::ApiError("No such mempool or blockchain transaction");
		return it->second;
	}
	std::string
	broadcast_raw(std::vector<std::uint8_t> const& tx) override {
		if (!broadcast_error.empty())
			throw Electrum::ApiError(broadcast_error);
		broadcasts.push_back(tx);
		return std::string(Elements::Tx::from_bytes(tx).get_txid());
	}
};

/* What the factory hands out: a client forwarding
 * to the one the test inspects.  */
class ForwardClient : public Electrum::ClientIF {
private:
	FakeClient& c;
public:
	explicit
	ForwardClient(FakeClient& c_) : c(c_) { }

	std::vector<Electrum::HistoryEntry>
	get_history(std::vector<std::uint8_t> const& spk) override {
		return c.get_history(spk);
	}
	std::vector<std::uint8_t>
	get_raw_transaction(Elements::TxId const& txid) override {
		return c.get_raw_transaction(txid);
	}
	std::string
	broadcast_raw(std::vector<std::uint8_t> const& tx) override {
		return c.broadcast_raw(tx);
	}
};

/* A transaction with an unrelated output, then the
 * lockup output, then the fee.  */
Elements::Tx funding_tx( Swap::Script const& script
		       , std::uint64_t value
		       , Secp256k1::Random& rand
		       ) {
	auto asset = Elements::policy_asset(testnet.network);

	auto tx = Elements::Tx();
	tx.nLockTime = 1202500;
	tx.inputs.resize(1);
	tx.inputs[0].prevTxid = Elements::TxId("3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c3c");
	tx.inputs[0].prevOut = 0;
	tx.inputs[0].nSequence = 0xFFFFFFFD;
	tx.outputs.resize(3);

	auto& change = tx.outputs[0];
	change.asset = Elements::ConfidentialAsset::from_asset(asset);
	change.value = Elements::ConfidentialValue::from_amount(7777);
	change.scriptPubKey = {0x00, 0x14, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17, 18, 19, 20};

	auto in = Elements::TxOutSecrets();
	in.asset = asset;
	in.value = value + 7777 + 300;

	auto& out = tx.outputs[1];
	out.scriptPubKey = script.lockup_scriptPubKey();
	auto abf = Elements::BlindingFactor::random(rand);
	out.asset = Elements::Blinder::blind_asset( asset, abf, {in}
						  , out.witness.surjectionProof
						  , rand
						  );
	auto zero = Elements::BlindingFactor();
	auto vbf = Elements::Blinder::final_vbf( {in.value, 7777, 300, value}
					       , {zero, zero, zero, abf}
					       , {zero, zero, zero, zero}
					       , 1
					       );
	out.value = Elements::Blinder::blind_value( value, asset, abf, vbf
						  , out.scriptPubKey
						  , script.get_blinding().pub()
						  , out.nonce
						  , out.witness.rangeProof
						  , rand
						  );

	auto& fee = tx.outputs[2];
	fee.asset = Elements::ConfidentialAsset::from_asset(asset);
	fee.value = Elements::ConfidentialValue::from_amount(300);
	return tx;
}

void publish(FakeClient& client, Swap::Script const& script, Elements::Tx const& tx) {
	auto entry = Electrum::HistoryEntry();
	entry.txid = tx.get_txid();
	entry.height = 0;
	client.histories[script.lockup_scriptPubKey()].push_back(entry);
	client.raws[std::string(entry.txid)] = tx.to_bytes();
}

template<typename E>
std::string error_of(std::function<void()> f) {
	try {
		f();
	} catch (E const& e) {
		return e.what();
	}
	return "";
}

bool starts_with(std::string const& s, std::string const& prefix) {
	return !prefix.empty() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string slurp(std::string const& path) {
	auto is = std::ifstream(path);
	auto os = std::ostringstream();
	os << is.rdbuf();
	return os.str();
}

}

int main() {
	std::uint8_t seed[32] = {0x13, 0x37};
	auto rand = Secp256k1::Random(seed);
	auto receiver = Secp256k1::KeyPair(rand);
	auto sender = Secp256k1::KeyPair(rand);
	auto blinding = Secp256k1::KeyPair(rand);
	auto dest_blinding = Secp256k1::KeyPair(rand);
	auto preimage = Ln::Preimage(rand);

	auto destination = std::string(Elements::Address::p2wsh(
		Elements::LiquidTestnet, {0x00, 0x51}, dest_blinding.pub()
	));
	auto mainnet_destination = std::string(Elements::Address::p2wsh(
		Elements::Liquid, {0x00, 0x51}, dest_blinding.pub()
	));

	auto script = Swap::Script( testnet, Swap::ReverseSubmarine
				  , preimage.hash160()
				  , receiver.pub(), sender.pub()
				  , 1202545, blinding
				  );
	auto funding = funding_tx(script, 250000, rand);

	assert(Swap::state_name(Swap::Tx::Created) == "created");
	assert(Swap::state_name(Swap::Tx::Located) == "located");
	assert(Swap::state_name(Swap::Tx::Signed) == "signed");
	assert(Swap::state_name(Swap::Tx::Failed) == "failed");
	assert(Swap::error_kind_name(Swap::Input) == "input");
	assert(Swap::error_kind_name(Swap::Transaction) == "transaction");
	assert(Swap::error_kind_name(Swap::Network) == "network");

	/* Bad destinations.  */
	{
		assert(!error_of<Swap::InputError>([&]() {
			Swap::Tx::new_claim(script, mainnet_destination, 1000);
		}).empty());
		assert(!error_of<Swap::InputError>([&]() {
			Swap::Tx::new_claim(script, "tlq1notanaddress", 1000);
		}).empty());
		auto e = Swap::InputError("x");
		assert(e.kind() == Swap::Input);
	}

	/* Nothing funded yet.  */
	{
		auto client = FakeClient();
		auto tx = Swap::Tx::new_claim(script, destination, 1000);
		assert(tx.get_state() == Swap::Tx::Created);
		assert(tx.get_kind() == Swap::Claim);
		assert(tx.get_fee() == 1000);
		assert(!tx.locate(client));
		assert(tx.get_state() == Swap::Tx::Created);
		assert(!tx.has_utxo());
		assert(!tx.check_utxo_value(250000));
		assert(starts_with( error_of<Swap::TransactionError>([&]() {
			tx.utxo();
		}), "No utxos available yet"));

		assert(starts_with( error_of<Swap::TransactionError>([&]() {
			tx.drain(client, receiver, preimage, rand);
		}), "No utxos available yet"));
		assert(tx.get_state() == Swap::Tx::Failed);
		assert(starts_with( error_of<Swap::TransactionError>([&]() {
			tx.drain(client, receiver, preimage, rand);
		}), "Swap transaction already failed"));
	}

	/* Claim, with logging and snapshots.  */
	{
		auto client = FakeClient();
		publish(client, script, funding);

		char tmpl[] = "/tmp/lqswap-test-XXXXXX";
		auto dir = mkdtemp(tmpl);
		assert(dir);

		auto log = std::ostringstream();
		auto env = Swap::StreamEnv(log);

		auto tx = Swap::Tx::new_claim(script, destination, 1000);
		tx.set_env(&env);
		tx.set_snapshot_dir(dir);

		assert(tx.locate(client));
		assert(tx.get_state() == Swap::Tx::Located);
		assert(tx.check_utxo_value(250000));
		assert(!tx.check_utxo_value(250001));
		assert(tx.utxo().txid == funding.get_txid());
		assert(tx.utxo().vout == 1);
		assert(tx.utxo().spent_value == funding.outputs[1].value);
		assert(log.str().find("debug: Swap tlq1") != std::string::npos);

		auto signed_tx = tx.drain(client, receiver, preimage, rand);
		assert(tx.get_state() == Swap::Tx::Signed);
		assert(signed_tx.inputs.size() == 1);
		assert(signed_tx.inputs[0].prevTxid == funding.get_txid());
		assert(signed_tx.inputs[0].prevOut == 1);
		assert(signed_tx.nLockTime == 1202545);
		assert(signed_tx.outputs[1].value.get_amount() == 1000);
		assert(Elements::Blinder::unblind( dest_blinding.priv()
						 , signed_tx.outputs[0]
						 ).value == 249000);

		auto actual = signed_tx.vsize();
		auto estimate = tx.estimated_vsize();
		assert(actual <= estimate);
		assert(estimate <= actual + 24);

		assert(starts_with( error_of<Swap::TransactionError>([&]() {
			tx.drain(client, receiver, preimage, rand);
		}), "Swap transaction already signed"));
		/* Refusing a second drain does not fail the swap.  */
		assert(tx.get_state() == Swap::Tx::Signed);

		auto previous = std::string(dir) + "/tx.previous";
		auto constructed = std::string(dir) + "/tx.constructed";
		assert(starts_with(slurp(previous), std::string(funding)));
		assert(starts_with(slurp(constructed), std::string(signed_tx)));
		assert(slurp(constructed).find("txid: " + std::string(signed_tx.get_txid())) != std::string::npos);
		unlink(previous.c_str());
		unlink(constructed.c_str());
		rmdir(dir);

		/* Broadcast.  */
		assert(tx.broadcast(client, signed_tx) == std::string(signed_tx.get_txid()));
		assert(client.broadcasts.size() == 1);
		assert(client.broadcasts[0] == signed_tx.to_bytes());

		client.broadcast_error = "sendrawtransaction RPC error: {\"code\":-26,\"message\":\"non-final\"}";
		try {
			tx.broadcast(client, signed_tx);
			assert(false);
		} catch (Swap::Error const& e) {
			assert(e.kind() == Swap::Network);
			assert(starts_with(e.what(), client.broadcast_error));
		}
		assert(log.str().find("error: Swap tlq1") != std::string::npos);
	}

	/* Refunds are not signed.  */
	{
		auto client = FakeClient();
		publish(client, script, funding);
		auto tx = Swap::Tx::new_refund(script, destination, 1000);
		assert(tx.get_kind() == Swap::Refund);
		assert(starts_with( error_of<Swap::TransactionError>([&]() {
			tx.drain(client, sender, Ln::Preimage(), rand);
		}), "Refund transaction signing not supported yet"));
		assert(tx.get_state() == Swap::Tx::Failed);
		/* It did find the output first.  */
		assert(tx.check_utxo_value(250000));

		/* A failed object stays failed.  */
		assert(starts_with( error_of<Swap::TransactionError>([&]() {
			tx.sign_claim(receiver, preimage, rand);
		}), "Cannot sign a claim for a refund"));
		assert(tx.get_state() == Swap::Tx::Failed);
	}
	{
		/* A located refund cannot be claimed either.  */
		auto refund = Swap::Tx::new_refund(script, destination, 1000);
		refund.manual_utxo_update(Elements::TxId("0404040404040404040404040404040404040404040404040404040404040404"), 0, 50000);
		assert(refund.get_state() == Swap::Tx::Located);
		assert(starts_with( error_of<Swap::TransactionError>([&]() {
			refund.sign_claim(receiver, preimage, rand);
		}), "Cannot sign a claim for a refund"));
		assert(refund.get_state() == Swap::Tx::Located);

		/* A failed claim cannot be revived.  */
		auto client = FakeClient();
		auto claim = Swap::Tx::new_claim(script, destination, 1000);
		assert(!error_of<Swap::TransactionError>([&]() {
			claim.drain(client, receiver, preimage, rand);
		}).empty());
		assert(claim.get_state() == Swap::Tx::Failed);
		claim.manual_utxo_update(Elements::TxId("0505050505050505050505050505050505050505050505050505050505050505"), 0, 50000);
		assert(claim.get_state() == Swap::Tx::Failed);
		assert(starts_with( error_of<Swap::TransactionError>([&]() {
			claim.sign_claim(receiver, preimage, rand);
		}), "Swap transaction already failed"));
		assert(claim.get_state() == Swap::Tx::Failed);
	}

	/* Server trouble.  */
	{
		auto client = FakeClient();
		client.history_error = "connection refused";
		auto tx = Swap::Tx::new_claim(script, destination, 1000);
		try {
			tx.locate(client);
			assert(false);
		} catch (Swap::NetworkError const& e) {
			assert(e.kind() == Swap::Network);
			assert(starts_with(e.what(), "connection refused"));
		}
		assert(tx.get_state() == Swap::Tx::Created);

		assert(!error_of<Swap::NetworkError>([&]() {
			tx.drain(client, receiver, preimage, rand);
		}).empty());
		assert(tx.get_state() == Swap::Tx::Failed);
	}
	{
		/* Server returns the wrong transaction.  */
		auto client = FakeClient();
		publish(client, script, funding);
		auto other = funding;
		other.nLockTime = 1;
		client.raws[std::string(funding.get_txid())] = other.to_bytes();
		auto tx = Swap::Tx::new_claim(script, destination, 1000);
		assert(starts_with( error_of<Swap::TransactionError>([&]() {
			tx.locate(client);
		}), "Server returned transaction"));
	}
	{
		/* History lists a transaction not paying the lockup.  */
		auto client = FakeClient();
		auto unrelated = funding;
		unrelated.outputs.erase(unrelated.outputs.begin() + 1);
		auto entry = Electrum::HistoryEntry();
		entry.txid = unrelated.get_txid();
		entry.height = 1202000;
		client.histories[script.lockup_scriptPubKey()].push_back(entry);
		client.raws[std::string(entry.txid)] = unrelated.to_bytes();
		auto tx = Swap::Tx::new_claim(script, destination, 1000);
		assert(!tx.locate(client));
	}
	{
		/* Blinded to some other key.  */
		auto other_blinding = Secp256k1::KeyPair(rand);
		auto other_script = Swap::Script( testnet, Swap::ReverseSubmarine
						, preimage.hash160()
						, receiver.pub(), sender.pub()
						, 1202545, other_blinding
						);
		auto client = FakeClient();
		publish(client, script, funding);
		auto tx = Swap::Tx::new_claim(other_script, destination, 1000);
		assert(!error_of<Swap::TransactionError>([&]() {
			tx.locate(client);
		}).empty());
	}

	/* Through the client factory.  */
	{
		auto client = FakeClient();
		publish(client, script, funding);
		auto built = std::vector<std::string>();

		auto tx = Swap::Tx::new_claim(script, destination, 2000);
		tx.set_client_factory([&](Electrum::Config const& c) {
			built.push_back(c.electrum_url);
			return std::unique_ptr<Electrum::ClientIF>(
				new ForwardClient(client)
			);
		});
		assert(tx.locate());
		auto signed_tx = tx.drain(receiver, preimage, rand);
		assert(tx.get_state() == Swap::Tx::Signed);
		assert(tx.broadcast(signed_tx) == std::string(signed_tx.get_txid()));
		assert(built.size() == 3);
		assert(built[0] == testnet.electrum_url);
	}
	{
		auto tx = Swap::Tx::new_claim(script, destination, 2000);
		tx.set_client_factory([](Electrum::Config const&) {
			throw Electrum::ApiError("bad url");
			return std::unique_ptr<Electrum::ClientIF>();
		});
		assert(starts_with( error_of<Swap::NetworkError>([&]() {
			tx.locate();
		}), "bad url"));
		assert(tx.get_state() == Swap::Tx::Created);
		assert(!error_of<Swap::NetworkError>([&]() {
			tx.drain(receiver, preimage, rand);
		}).empty());
		assert(tx.get_state() == Swap::Tx::Failed);
	}

	/* Manual utxo.  */
	{
		auto tx = Swap::Tx::new_claim(script, destination, 100);
		auto txid = Elements::TxId("0202020202020202020202020202020202020202020202020202020202020202");
		tx.manual_utxo_update(txid, 5, 90000);
		assert(tx.get_state() == Swap::Tx::Located);
		assert(tx.check_utxo_value(90000));
		assert(tx.utxo().asset() == Elements::policy_asset(Elements::LiquidTestnet));
		assert(tx.utxo().spent_value.get_amount() == 90000);

		/* A miss leaves it alone.  */
		auto client = FakeClient();
		assert(!tx.locate(client));
		assert(tx.utxo().txid == txid);

		/* sign_claim errors do not fail the swap.  */
		assert(!error_of<Swap::InputError>([&]() {
			tx.sign_claim(sender, preimage, rand);
		}).empty());
		assert(tx.get_state() == Swap::Tx::Located);

		auto signed_tx = tx.sign_claim(receiver, preimage, rand);
		assert(tx.get_state() == Swap::Tx::Signed);
		assert(signed_tx.inputs[0].prevTxid == txid);
		assert(signed_tx.inputs[0].prevOut == 5);

		/* Signing twice is refused.  */
		assert(starts_with( error_of<Swap::TransactionError>([&]() {
			tx.sign_claim(receiver, preimage, rand);
		}), "Swap transaction already signed"));
		assert(tx.get_state() == Swap::Tx::Signed);
	}
	{
		auto tx = Swap::Tx::new_claim(script, destination, 100001);
		tx.manual_utxo_update(Elements::TxId("0303030303030303030303030303030303030303030303030303030303030303"), 0, 100000);
		assert(starts_with( error_of<Swap::TransactionError>([&]() {
			tx.sign_claim(receiver, preimage, rand);
		}), "Fee 100001 exceeds swap output value 100000"));
		/* A found output replaces the manual one.  */
		auto client = FakeClient();
		publish(client, script, funding);
		assert(tx.locate(client));
		assert(tx.check_utxo_value(250000));
	}

	/* Submarine lockups are found through their
	 * P2SH scriptPubKey.  */
	{
		auto sub = Swap::Script( testnet, Swap::Submarine
				       , preimage.hash160()
				       , receiver.pub(), sender.pub()
				       , 1202545, blinding
				       );
		auto sub_funding = funding_tx(sub, 60000, rand);
		auto client = FakeClient();
		publish(client, sub, sub_funding);
		auto tx = Swap::Tx::new_claim(sub, destination, 500);
		auto signed_tx = tx.drain(client, receiver, preimage, rand);
		assert(signed_tx.inputs[0].scriptSig.size() == 35);
		assert(tx.estimated_vsize() >= signed_tx.vsize());
	}

	return 0;
}
