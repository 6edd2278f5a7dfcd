#ifndef SECP256K1_PRIVKEY_HPP
#define SECP256K1_PRIVKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<ostream>
#include<stdexcept>
#include<string>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class PubKey; }
namespace Secp256k1 { class Random; }
namespace Secp256k1 { class Signature; }
namespace Sha256 { class Hash; }

std::ostream& operator<<(std::ostream&, Secp256k1::PrivKey const&);

namespace Secp256k1 {

/* Thrown if caller-provided data would result in an invalid
 * private key.
 */
class InvalidPrivKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPrivKey()
		: Util::BacktraceException<std::invalid_argument>("Invalid private key.")
		{ }
};

/** class Secp256k1::PrivKey
 *
 * @brief a 32-byte scalar in the range [1, n).
 * Cleared on destruction.
 */
class PrivKey {
private:
	std::uint8_t key[32];

	PrivKey( std::uint8_t const key_[32] );

public:
	PrivKey();

	/* Load private key from a hex-encoded string.  */
	explicit PrivKey(std::string const&);
	/* Get hex-encoded private key.  */
	explicit operator std::string() const;
	/* Pick a random private key.  */
	explicit PrivKey(Secp256k1::Random& rand);
	/* Copy an existing private key.  */
	PrivKey(PrivKey const&);
	PrivKey& operator=(PrivKey const&);

	~PrivKey();

	static PrivKey from_buffer(std::uint8_t const buffer[32]) {
		return PrivKey(buffer);
	}
	void to_buffer(std::uint8_t buffer[32]) const {
		for (auto i = 0; i < 32; ++i)
			buffer[i] = key[i];
	}

	bool operator==(PrivKey const& o) const;
	bool operator!=(PrivKey const& o) const {
		return !(*this == o);
	}

	friend class PubKey;
	friend class Signature;
	friend std::ostream& ::operator<<(std::ostream&, Secp256k1::PrivKey const&);
	friend Sha256::Hash ecdh(Secp256k1::PrivKey const&, Secp256k1::PubKey const&);
};

}

#endif /* SECP256K1_PRIVKEY_HPP */
