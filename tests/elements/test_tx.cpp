#undef NDEBUG
#include"Bitcoin/script_to_scriptPubKey.hpp"
#include"Elements/Network.hpp"
#include"Elements/Tx.hpp"
#include"Elements/TxId.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<string>

namespace {

auto const unsigned_hex = std::string("")
	+ "02000000" "00"
	+ "01"
	+ "ffeeddccbbaa99887766554433221100ffeeddccbbaa99887766554433221100" "01000000" "00" "feffffff"
	+ "02"
	+ "01499a818545f6bae39fc03b637f2a4e1e64e590cac1bc3a6f6d71aa4443654c14" "0100000000000003e8" "00"
	+ "22" "00204ae81572f06e1b88fd5ced7a1a000945432e83e1551e6f721ee9c00b8cc33260"
	+ "01499a818545f6bae39fc03b637f2a4e1e64e590cac1bc3a6f6d71aa4443654c14" "010000000000000064" "00"
	+ "00"
	+ "71591200"
	;
/* Same, with a two-item witness stack on the input.  */
auto const witness_hex = std::string("")
	+ "02000000" "01"
	+ unsigned_hex.substr(10, unsigned_hex.size() - 10)
	+ "00" "00" "02" "00" "0151" "00"
	+ "00" "00"
	+ "00" "00"
	;

Elements::Tx make_tx() {
	auto asset = Elements::policy_asset(Elements::LiquidTestnet);

	auto tx = Elements::Tx();
	tx.nVersion = 2;
	tx.nLockTime = 1202545;
	tx.inputs.resize(1);
	tx.inputs[0].prevTxid = Elements::TxId("00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff");
	tx.inputs[0].prevOut = 1;
	tx.inputs[0].nSequence = 0xFFFFFFFE;
	tx.outputs.resize(2);
	tx.outputs[0].asset = Elements::ConfidentialAsset::from_asset(asset);
	tx.outputs[0].value = Elements::ConfidentialValue::from_amount(1000);
	tx.outputs[0].scriptPubKey = Bitcoin::p2wsh_scriptPubKey({0x51});
	tx.outputs[1].asset = Elements::ConfidentialAsset::from_asset(asset);
	tx.outputs[1].value = Elements::ConfidentialValue::from_amount(100);
	return tx;
}

}

int main() {
	auto const txid = Elements::TxId("121c11bc409e936e0253a04b86c6dd1c615676d18ee3d6770c671eadfc70cce0");

	/* Serialization without witnesses.  */
	{
		auto tx = make_tx();
		assert(!tx.has_witness());
		assert(std::string(tx) == unsigned_hex);
		assert(tx.get_txid() == txid);
		assert(tx.vsize() == 174);
		assert(!tx.outputs[0].is_fee());
		assert(tx.outputs[1].is_fee());

		auto parsed = Elements::Tx(unsigned_hex);
		assert(parsed.inputs == tx.inputs);
		assert(parsed.outputs == tx.outputs);
		assert(parsed.nLockTime == 1202545);
		assert(Elements::Tx::from_bytes(tx.to_bytes()).get_txid() == txid);
	}

	/* Witnesses change the serialization, not the txid.  */
	{
		auto tx = make_tx();
		tx.inputs[0].witness.scriptWitness.push_back({});
		tx.inputs[0].witness.scriptWitness.push_back({0x51});
		assert(tx.has_witness());
		assert(std::string(tx) == witness_hex);
		assert(tx.get_txid() == txid);
		assert(tx.vsize() == 177);

		auto parsed = Elements::Tx(witness_hex);
		assert(parsed.inputs[0].witness == tx.inputs[0].witness);
		assert(std::string(parsed) == witness_hex);
	}

	/* Peg-in flag survives a round trip.  */
	{
		auto tx = make_tx();
		tx.inputs[0].is_pegin = true;
		auto parsed = Elements::Tx::from_bytes(tx.to_bytes());
		assert(parsed.inputs[0].is_pegin);
		assert(parsed.inputs[0].prevOut == 1);
	}

	/* Asset issuance inputs are refused.  */
	{
		auto hex = unsigned_hex;
		/* Top byte of the prevout index.  */
		hex.replace(12 + 64 + 6, 2, "80");
		auto flag = false;
		try {
			auto tx = Elements::Tx(hex);
			(void) tx;
		} catch (Elements::TxParseError const&) {
			flag = true;
		}
		assert(flag);
	}

	/* Malformed input.  */
	{
		auto flag = false;
		try {
			Elements::Tx(unsigned_hex.substr(0, unsigned_hex.size() - 2));
		} catch (Elements::TxParseError const&) {
			flag = true;
		}
		assert(flag);

		flag = false;
		try {
			Elements::Tx(unsigned_hex + "00");
		} catch (Elements::TxParseError const&) {
			flag = true;
		}
		assert(flag);

		flag = false;
		try {
			Elements::Tx("not hex");
		} catch (Elements::TxParseError const&) {
			flag = true;
		}
		assert(flag);
	}

	return 0;
}
