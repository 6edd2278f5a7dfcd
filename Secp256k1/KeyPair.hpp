#ifndef SECP256K1_KEYPAIR_HPP
#define SECP256K1_KEYPAIR_HPP

#include<string>
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"

namespace Secp256k1 { class Random; }

namespace Secp256k1 {

/** class Secp256k1::KeyPair
 *
 * @brief a private key with its public key,
 * derived once at construction.
 *
 * @desc The claim signer and the swap blinding
 * key are both held as one of these.
 * Immutable apart from whole-object assignment.
 */
class KeyPair {
private:
	Secp256k1::PrivKey sk;
	Secp256k1::PubKey pk;

public:
	KeyPair() : sk(), pk(sk) { }
	explicit KeyPair(Secp256k1::PrivKey const& sk_) : sk(sk_), pk(sk) { }
	explicit KeyPair(Secp256k1::Random& rand) : sk(rand), pk(sk) { }

	/* 64 hex digits; throws like `Secp256k1::PrivKey`.  */
	static KeyPair from_hex(std::string const& hex) {
		return KeyPair(Secp256k1::PrivKey(hex));
	}

	Secp256k1::PrivKey const& priv() const { return sk; }
	Secp256k1::PubKey const& pub() const { return pk; }
};

}

#endif /* SECP256K1_KEYPAIR_HPP */
