#ifndef ELEMENTS_SIGHASH_HPP
#define ELEMENTS_SIGHASH_HPP

#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Elements { class ConfidentialValue; }
namespace Elements { struct Tx; }
namespace Sha256 { class Hash; }

namespace Elements {

enum SighashFlags
{ SIGHASH_ALL = 1
, SIGHASH_NONE = 2
, SIGHASH_SINGLE = 3
, SIGHASH_ANYONECANPAY = 0x80
};

struct InvalidSighash : public Util::BacktraceException<std::invalid_argument> {
	InvalidSighash() =delete;
	InvalidSighash(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			std::string("Elements::InvalidSighash: ") + msg
		  ) { }
};

/** Elements::sighash
 *
 * @brief computes the segwit v0 sighash for the
 * given transaction, being signed with the given
 * flags, and signing for the input nIn.
 *
 * @desc throws `Elements::InvalidSighash`
 * if the given `flags` is not recognized,
 * or if `nIn` is out-of-range.
 *
 * Differs from the Bitcoin algorithm in that
 * the spent `value` is the confidential value
 * of the output being spent (a 33-byte
 * commitment if it was blinded), a hash of the
 * inputs' issuances follows `hashSequence`, and
 * outputs are hashed in their Elements
 * serialization.
 *
 * For P2WSH the `scriptCode` is the
 * `witnessScript` whose hash is what is
 * committed in the `scriptPubKey`, and which
 * is the top of the witness stack.
 * It is length-prefixed here; do not prefix it.
 */
Sha256::Hash
sighash( Elements::Tx const& tx
       , SighashFlags flags
       , std::size_t nIn
       , Elements::ConfidentialValue const& value
       , std::vector<std::uint8_t> const& scriptCode
       );

}

#endif /* !defined(ELEMENTS_SIGHASH_HPP) */
