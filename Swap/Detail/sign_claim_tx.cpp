#include"Bitcoin/Script.hpp"
#include"Bitcoin/script_to_scriptPubKey.hpp"
#include"Elements/Tx.hpp"
#include"Elements/sighash.hpp"
#include"Ln/Preimage.hpp"
#include"Ripemd160/Hash.hpp"
#include"Secp256k1/KeyPair.hpp"
#include"Secp256k1/Signature.hpp"
#include"Sha256/Hash.hpp"
#include"Swap/Detail/sign_claim_tx.hpp"
#include"Swap/Error.hpp"
#include"Swap/Script.hpp"
#include"Swap/Utxo.hpp"

namespace Swap { namespace Detail {

void sign_claim_tx( Elements::Tx& tx
		  , Swap::Script const& script
		  , Secp256k1::KeyPair const& keys
		  , Ln::Preimage const& preimage
		  , Swap::Utxo const& utxo
		  ) {
	if (!preimage)
		throw InputError("Claim needs the preimage, none given");
	if (preimage.hash160() != script.get_hashlock())
		throw InputError("Preimage does not match the swap hashlock");
	if (keys.pub() != script.get_receiver())
		throw InputError("Signing key is not the swap receiver key");
	if (tx.inputs.size() != 1)
		throw TransactionError("Claim must have exactly one input");

	auto witnessScript = script.to_script();

	auto& input = tx.inputs[0];
	switch (script.get_direction()) {
	case Submarine:
		input.scriptSig = Bitcoin::ScriptBuilder()
			.push(Bitcoin::p2wsh_scriptPubKey(witnessScript))
			.get()
			;
		break;
	case ReverseSubmarine:
		input.scriptSig.clear();
		break;
	}

	auto hash = Elements::sighash( tx
				     , Elements::SIGHASH_ALL
				     , 0
				     , utxo.spent_value
				     , witnessScript
				     );
	auto sig = Secp256k1::Signature::create(keys.priv(), hash);
	auto der = sig.der_encode();
	der.push_back(std::uint8_t(Elements::SIGHASH_ALL));

	/* The bottom element is never examined by the
	 * hashlock branch.  */
	auto& stack = input.witness.scriptWitness;
	stack.clear();
	stack.push_back(std::vector<std::uint8_t>());
	stack.push_back(std::move(der));
	stack.push_back(preimage.to_vector());
	stack.push_back(std::move(witnessScript));
}

}}
