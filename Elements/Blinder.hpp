#ifndef ELEMENTS_BLINDER_HPP
#define ELEMENTS_BLINDER_HPP

#include"Elements/Confidential.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Elements { struct TxOut; }
namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class PubKey; }
namespace Secp256k1 { class Random; }

namespace Elements {

/* Thrown when an output cannot be blinded or
 * unblinded.  */
class BlindingFailed : public Util::BacktraceException<std::runtime_error> {
public:
	BlindingFailed(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"Blinding failed: " + msg
		  ) { }
};

/** struct Elements::BlindingFactor
 *
 * @brief a 32-byte scalar hiding an asset or a
 * value in a commitment.
 * Zero means "not blinded".
 */
struct BlindingFactor {
	std::uint8_t data[32];

	BlindingFactor();
	static BlindingFactor random(Secp256k1::Random&);
	static BlindingFactor from_buffer(std::uint8_t const buf[32]);

	bool is_zero() const;
	explicit operator std::string() const;

	bool operator==(BlindingFactor const&) const;
	bool operator!=(BlindingFactor const& o) const {
		return !(*this == o);
	}
};

/** struct Elements::TxOutSecrets
 *
 * @brief what the owner of a blinded output knows
 * about it.
 */
struct TxOutSecrets {
	AssetId asset;
	BlindingFactor abf;
	std::uint64_t value;
	BlindingFactor vbf;

	TxOutSecrets() : value(0) { }
};

namespace Blinder {

/** Elements::Blinder::unblind
 *
 * @brief recover the secrets of an output sent to
 * the given blinding key.
 *
 * @desc The range proof nonce is the SHA256 of the
 * ECDH shared secret between the blinding key and
 * the output's nonce.
 * Rewinding the proof gives the value, the value
 * blinding factor, and a message holding the asset
 * and its blinding factor; the asset commitment
 * rebuilt from the latter must match the output.
 *
 * An output with explicit asset and value unblinds
 * to those, with zero blinding factors.
 *
 * Throws `BlindingFailed`.
 */
TxOutSecrets unblind( Secp256k1::PrivKey const& blinding_key
		    , Elements::TxOut const& out
		    );

/** Elements::Blinder::blind_asset
 *
 * @brief commit to `asset` under `abf`, and prove
 * the result is one of the `inputs` assets.
 *
 * @desc The surjection proof uses up to three of
 * the inputs, 100 iterations, and a seed drawn
 * from `rand`.
 */
ConfidentialAsset blind_asset( AssetId const& asset
			     , BlindingFactor const& abf
			     , std::vector<TxOutSecrets> const& inputs
			     , std::vector<std::uint8_t>& surjectionProof
			     , Secp256k1::Random& rand
			     );

/** Elements::Blinder::final_vbf
 *
 * @brief the value blinding factor of the last
 * output that makes the commitments balance.
 *
 * @desc `values`, `abfs` and `vbfs` are given in
 * the same order: the first `n_inputs` entries are
 * inputs, the rest outputs.
 * The last entry of `vbfs` is ignored.
 * Explicit entries have zero factors.
 */
BlindingFactor final_vbf( std::vector<std::uint64_t> const& values
			, std::vector<BlindingFactor> const& abfs
			, std::vector<BlindingFactor> const& vbfs
			, std::size_t n_inputs
			);

/** Elements::Blinder::blind_value
 *
 * @brief commit to `value` and sign a range proof
 * that the destination can rewind.
 *
 * @desc A fresh ephemeral key from `rand` is put in
 * `nonce`; its ECDH with `receiver` seeds the range
 * proof.
 * The proof covers 52 bits with exponent 0, commits
 * to `scriptPubKey`, and carries `asset || abf` as
 * its message.
 */
ConfidentialValue blind_value( std::uint64_t value
			     , AssetId const& asset
			     , BlindingFactor const& abf
			     , BlindingFactor const& vbf
			     , std::vector<std::uint8_t> const& scriptPubKey
			     , Secp256k1::PubKey const& receiver
			     , ConfidentialNonce& nonce
			     , std::vector<std::uint8_t>& rangeProof
			     , Secp256k1::Random& rand
			     );

/* Checks a validator would make on a blinded
 * transaction.  */
bool verify_surjection( Elements::TxOut const& out
		      , std::vector<ConfidentialAsset> const& inputs
		      );
bool verify_rangeproof(Elements::TxOut const& out);
/* Sum of `spent` commitments equals sum of
 * `outputs` commitments.  */
bool verify_balance( std::vector<Elements::TxOut> const& spent
		   , std::vector<Elements::TxOut> const& outputs
		   );

}

}

#endif /* !defined(ELEMENTS_BLINDER_HPP) */
