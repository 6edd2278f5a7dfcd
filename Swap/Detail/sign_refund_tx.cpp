#include"Swap/Detail/sign_refund_tx.hpp"
#include"Swap/Error.hpp"

namespace Swap { namespace Detail {

void sign_refund_tx( Elements::Tx&
		   , Swap::Script const&
		   , Secp256k1::KeyPair const&
		   , Swap::Utxo const&
		   ) {
	/* TODO: spend the OP_ELSE branch: sender
	 * signature, a witness element that fails the
	 * hashlock test, nLockTime at or past the
	 * timelock, and a non-final nSequence.  */
	throw TransactionError("Refund transaction signing not supported yet");
}

}}
