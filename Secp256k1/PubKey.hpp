#ifndef SECP256K1_PUBKEY_HPP
#define SECP256K1_PUBKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>
#include<utility>
#include<vector>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class PubKey; }
namespace Secp256k1 { class Signature; }
namespace Sha256 { class Hash; }

std::ostream& operator<<(std::ostream&, Secp256k1::PubKey const&);

namespace Secp256k1 {

/* Thrown in case of being fed an invalid public key.  */
class InvalidPubKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPubKey() : Util::BacktraceException<std::invalid_argument>("Invalid public key.") { }
};

Sha256::Hash ecdh(Secp256k1::PrivKey const&, Secp256k1::PubKey const&);

/** class Secp256k1::PubKey
 *
 * @brief a point on the curve, always serialized
 * in the 33-byte compressed form.
 */
class PubKey {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	explicit PubKey(std::uint8_t const buffer[33]);

	/* Used by Signature::valid and ecdh.  */
	void const* get_key() const;

public:
	/* Get G.  */
	PubKey();
	/* Load public key from a hex-encoded string.  */
	explicit PubKey(std::string const&);
	/* Create hex-encoded string.  */
	explicit operator std::string() const;
	/* Get the public key behind the given private key.  */
	explicit PubKey(Secp256k1::PrivKey const&);

	/* Copy an existing public key.  */
	PubKey(PubKey const&);
	PubKey(PubKey&&);

	~PubKey();

	PubKey& operator=(PubKey const& o) {
		auto tmp = PubKey(o);
		tmp.pimpl.swap(pimpl);
		return *this;
	}
	PubKey& operator=(PubKey&& o) {
		auto tmp = PubKey(std::move(o));
		tmp.pimpl.swap(pimpl);
		return *this;
	}

	bool operator==(PubKey const&) const;
	bool operator!=(PubKey const& o) const {
		return !(*this == o);
	}

	friend std::ostream& ::operator<<(std::ostream&, PubKey const&);

	static PubKey from_buffer(std::uint8_t const buffer[33]) {
		return PubKey(buffer);
	}
	/* Throws InvalidPubKey unless exactly 33 bytes
	 * that parse as a compressed point.  */
	static PubKey from_vector(std::vector<std::uint8_t> const&);

	void to_buffer(std::uint8_t buffer[33]) const;
	std::vector<std::uint8_t> to_vector() const;

	friend class Secp256k1::Signature;
	friend Sha256::Hash ecdh(Secp256k1::PrivKey const&, Secp256k1::PubKey const&);
};

}

#endif /* SECP256K1_PUBKEY_HPP */
