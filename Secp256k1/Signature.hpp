#ifndef SECP256K1_SIGNATURE_HPP
#define SECP256K1_SIGNATURE_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class PubKey; }
namespace Sha256 { class Hash; }

namespace Secp256k1 {

class BadSignatureEncoding : public Util::BacktraceException<std::invalid_argument> {
public:
	BadSignatureEncoding()
		: Util::BacktraceException<std::invalid_argument>("Bad signature encoding")
		{ }
};

/** class Secp256k1::Signature
 *
 * @brief an ECDSA signature, always normalized
 * to low-S.
 */
class Signature {
private:
	std::uint8_t data[64];

	Signature( Secp256k1::PrivKey const&
		 , Sha256::Hash const&
		 );
	Signature(std::uint8_t const buffer[64]);

public:
	Signature();
	Signature(Signature const&) =default;
	Signature& operator=(Signature const&) =default;

	explicit Signature(std::string const&);

	static
	Signature from_buffer(std::uint8_t const buffer[64]) {
		return Signature(buffer);
	}

	void to_buffer(std::uint8_t buffer[64]) const;

	/* Check if the signature is valid for the given pubkey
	 * and message hash.
	 * We impose the low-s rule.
	 */
	bool valid( Secp256k1::PubKey const& pk
		  , Sha256::Hash const& m
		  ) const;

	/** Secp256k1::Signature::create
	 *
	 * @brief Create a deterministic (RFC6979) signature
	 * for the given privkey and message hash.
	 *
	 * @desc The R value is ground until its top bit is
	 * clear, so the DER encoding is at most 70 bytes.
	 * The first attempt uses no extra entropy; later
	 * attempts feed a little-endian counter.
	 */
	static
	Signature create( Secp256k1::PrivKey const& sk
			, Sha256::Hash const& m
			) {
		return Signature(sk, m);
	}

	/* True if the R value has its top bit clear.  */
	bool has_low_r() const;

	/** Secp256k1::Signature::der_encode
	 *
	 * @brief Return the DER-encoding of the signature.
	 */
	std::vector<std::uint8_t> der_encode() const;
	/** Secp256k1::Signature::der_decode
	 *
	 * @brief Return the signature from the der
	 * decoding.
	 * Throws BadSignatureEncoding on failure.
	 */
	static
	Signature der_decode(std::vector<std::uint8_t> const& d);
};

}

#endif /* SECP256K1_SIGNATURE_HPP */
