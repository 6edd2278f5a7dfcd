#include"Elements/Address.hpp"
#include"Elements/Blinder.hpp"
#include"Elements/Network.hpp"
#include"Elements/Tx.hpp"
#include"Swap/Detail/build_claim_tx.hpp"
#include"Swap/Error.hpp"
#include"Swap/Script.hpp"
#include"Swap/Utxo.hpp"

namespace Swap { namespace Detail {

Elements::Tx
build_claim_tx( Swap::Script const& script
	      , Swap::Utxo const& utxo
	      , Elements::Address const& destination
	      , std::uint64_t fee
	      , Secp256k1::Random& rand
	      ) {
	auto const& in = utxo.secrets;
	if (fee > in.value)
		throw TransactionError( "Fee " + std::to_string(fee)
				      + " exceeds swap output value "
				      + std::to_string(in.value)
				      );
	auto output_value = in.value - fee;

	auto network = script.get_config().network;
	if (destination.network() != network)
		throw InputError( "Destination address is not on "
				+ Elements::network_name(network)
				);
	/* Fees are paid in the policy asset; the claim
	 * balances only if the swap is in it too.  */
	if (in.asset != Elements::policy_asset(network))
		throw TransactionError( "Swap output is not in the "
				      + Elements::network_name(network)
				      + " policy asset"
				      );

	auto tx = Elements::Tx();
	tx.nVersion = 2;
	tx.nLockTime = script.get_timelock();

	tx.inputs.resize(1);
	tx.inputs[0].prevTxid = utxo.txid;
	tx.inputs[0].prevOut = utxo.vout;
	tx.inputs[0].nSequence = 0xFFFFFFFF;
	tx.inputs[0].scriptSig.clear();
	/* signature, preimage, witnessScript, filled by
	 * the signer.  */
	tx.inputs[0].witness.scriptWitness.clear();

	tx.outputs.resize(2);
	auto& pay = tx.outputs[0];
	auto& fee_out = tx.outputs[1];

	pay.scriptPubKey = destination.scriptPubKey();

	try {
		auto out_abf = Elements::BlindingFactor::random(rand);
		pay.asset = Elements::Blinder::blind_asset(
			in.asset, out_abf,
			std::vector<Elements::TxOutSecrets>{in},
			pay.witness.surjectionProof,
			rand
		);

		/* The fee output is explicit, so it has zero
		 * factors.  */
		auto zero = Elements::BlindingFactor();
		auto out_vbf = Elements::Blinder::final_vbf(
			{in.value, fee, output_value},
			{in.abf, zero, out_abf},
			{in.vbf, zero, zero},
			1
		);

		/* An explicit input whose whole value goes to
		 * the fee leaves a zero value under a zero
		 * factor, which has no commitment.  */
		if (output_value == 0 && out_vbf.is_zero()) {
			pay.asset = Elements::ConfidentialAsset::from_asset(in.asset);
			pay.value = Elements::ConfidentialValue::from_amount(0);
			pay.nonce = Elements::ConfidentialNonce();
			pay.witness.surjectionProof.clear();
			pay.witness.rangeProof.clear();
		} else {
			pay.value = Elements::Blinder::blind_value(
				output_value, in.asset, out_abf, out_vbf,
				pay.scriptPubKey,
				destination.blinding_pubkey(),
				pay.nonce,
				pay.witness.rangeProof,
				rand
			);
		}
	} catch (Elements::BlindingFailed const& e) {
		throw TransactionError(e.what());
	}

	fee_out.asset = Elements::ConfidentialAsset::from_asset(
		Elements::policy_asset(network)
	);
	fee_out.value = Elements::ConfidentialValue::from_amount(fee);
	fee_out.scriptPubKey.clear();

	return tx;
}

}}
