#include"Bitcoin/le.hpp"
#include"Bitcoin/varbytes.hpp"
#include"Elements/Tx.hpp"
#include"Elements/sighash.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/HasherStream.hpp"

namespace {

void feed_hash(std::ostream& hasher, Sha256::Hash const& hash) {
	std::uint8_t buf[32];
	hash.to_buffer(buf);
	for (auto i = std::size_t(0); i < sizeof(buf); ++i)
		hasher.put(buf[i]);
}

using ::Elements::SighashFlags;
using ::Elements::SIGHASH_ALL;
using ::Elements::SIGHASH_NONE;
using ::Elements::SIGHASH_SINGLE;
using ::Elements::SIGHASH_ANYONECANPAY;
using ::Elements::InvalidSighash;

void
sighash_core( Elements::Tx const& tx
	    , SighashFlags flags
	    , std::size_t nIn
	    , Elements::ConfidentialValue const& value
	    , std::vector<std::uint8_t> const& scriptCode
	    , std::ostream& hasher
	    ) {

	auto loflags = flags & 0x1F;
	auto hiflags = flags & 0xE0;

	switch (loflags) {
	case SIGHASH_ALL:
	case SIGHASH_NONE:
	case SIGHASH_SINGLE:
		break;
	default:
		throw InvalidSighash("Invalid SIGHASH flag");
	}
	switch (hiflags) {
	case 0:
	case SIGHASH_ANYONECANPAY:
		break;
	default:
		throw InvalidSighash("Invalid SIGHASH flag");
	}

	if (nIn >= tx.inputs.size())
		throw InvalidSighash("nIn out of range");

	auto hashPrevouts = Sha256::Hash();
	auto hashSequence = Sha256::Hash();
	auto hashIssuance = Sha256::Hash();
	if (!(hiflags & SIGHASH_ANYONECANPAY)) {
		Sha256::HasherStream prevouts;
		Sha256::HasherStream issuances;
		for (auto const& i : tx.inputs) {
			prevouts << i.prevTxid
				 << Bitcoin::le(i.prevOut)
				  ;
			/* No input issues an asset.  */
			issuances.put(0x00);
		}
		hashPrevouts = std::move(prevouts).finalize_double();
		hashIssuance = std::move(issuances).finalize_double();
	}
	if ( !(hiflags & SIGHASH_ANYONECANPAY)
	  && (loflags != SIGHASH_SINGLE)
	  && (loflags != SIGHASH_NONE)
	   ) {
		Sha256::HasherStream sequences;
		for (auto const& i : tx.inputs)
			sequences << Bitcoin::le(i.nSequence);
		hashSequence = std::move(sequences).finalize_double();
	}

	auto hashOutputs = Sha256::Hash();
	if ( (loflags != SIGHASH_SINGLE)
	  && (loflags != SIGHASH_NONE)
	   ) {
		Sha256::HasherStream outputs;
		for (auto const& o : tx.outputs)
			outputs << o;
		hashOutputs = std::move(outputs).finalize_double();
	} else if ((loflags == SIGHASH_SINGLE) && nIn < tx.outputs.size()) {
		Sha256::HasherStream outputs;
		outputs << tx.outputs[nIn];
		hashOutputs = std::move(outputs).finalize_double();
	}

	/* Hashing sequence.  */
	hasher << Bitcoin::le(tx.nVersion);
	feed_hash(hasher, hashPrevouts);
	feed_hash(hasher, hashSequence);
	feed_hash(hasher, hashIssuance);

	/* Input being signed.  */
	hasher << tx.inputs[nIn].prevTxid
	       << Bitcoin::le(tx.inputs[nIn].prevOut)
	       << Bitcoin::varbytes(scriptCode)
	       << value
	       << Bitcoin::le(tx.inputs[nIn].nSequence)
		;

	feed_hash(hasher, hashOutputs);
	hasher << Bitcoin::le(tx.nLockTime)
	       << Bitcoin::le(std::uint32_t(flags))
		;
}

}

namespace Elements {

Sha256::Hash
sighash( Elements::Tx const& tx
       , SighashFlags flags
       , std::size_t nIn
       , Elements::ConfidentialValue const& value
       , std::vector<std::uint8_t> const& scriptCode
       ) {
	Sha256::HasherStream hasher;
	sighash_core(tx, flags, nIn, value, scriptCode, hasher);
	return std::move(hasher).finalize_double();
}

}
