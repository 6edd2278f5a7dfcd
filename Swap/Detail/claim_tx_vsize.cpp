#include"Bitcoin/Script.hpp"
#include"Bitcoin/script_to_scriptPubKey.hpp"
#include"Elements/Address.hpp"
#include"Elements/Network.hpp"
#include"Elements/Tx.hpp"
#include"Swap/Detail/claim_tx_vsize.hpp"
#include"Swap/Script.hpp"

namespace {

std::vector<std::uint8_t> placeholder(std::uint8_t prefix) {
	auto ret = std::vector<std::uint8_t>(33, 0x00);
	ret[0] = prefix;
	return ret;
}

}

namespace Swap { namespace Detail {

std::size_t claim_tx_vsize( Swap::Script const& script
			  , Elements::Address const& destination
			  ) {
	auto witnessScript = script.to_script();

	auto tx = Elements::Tx();
	tx.inputs.resize(1);
	auto& input = tx.inputs[0];
	switch (script.get_direction()) {
	case Submarine:
		input.scriptSig = Bitcoin::ScriptBuilder()
			.push(Bitcoin::p2wsh_scriptPubKey(witnessScript))
			.get()
			;
		break;
	case ReverseSubmarine:
		break;
	}
	input.witness.scriptWitness.push_back(std::vector<std::uint8_t>());
	/* DER signature plus sighash byte, worst case.  */
	input.witness.scriptWitness.push_back(std::vector<std::uint8_t>(73));
	input.witness.scriptWitness.push_back(std::vector<std::uint8_t>(32));
	input.witness.scriptWitness.push_back(witnessScript);

	tx.outputs.resize(2);
	auto& pay = tx.outputs[0];
	pay.asset = Elements::ConfidentialAsset::from_generator(placeholder(0x0a));
	pay.value = Elements::ConfidentialValue::from_commitment(placeholder(0x08));
	pay.nonce = Elements::ConfidentialNonce::from_pubkey(
		destination.blinding_pubkey()
	);
	pay.scriptPubKey = destination.scriptPubKey();
	pay.witness.surjectionProof.resize(default_surjectionproof_size);
	pay.witness.rangeProof.resize(default_rangeproof_size);

	auto& fee = tx.outputs[1];
	fee.asset = Elements::ConfidentialAsset::from_asset(
		Elements::policy_asset(script.get_config().network)
	);
	fee.value = Elements::ConfidentialValue::from_amount(0);

	return tx.vsize();
}

}}
