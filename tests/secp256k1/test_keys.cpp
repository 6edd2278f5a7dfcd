#undef NDEBUG
#include"Secp256k1/KeyPair.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Sha256/Hash.hpp"
#include<assert.h>
#include<string>
#include<vector>

int main() {
	auto kp = Secp256k1::KeyPair::from_hex("aecbc2bddfcd3fa6953d257a9f369dc20cdc66f2605c73efb4c91b90703506b6");
	assert( std::string(kp.pub())
	     == "02ccbab5f97c89afb97d814831c5355ef5ba96a18c9dcd1b5c8cfd42c697bfe53c"
	      );

	auto blinding = Secp256k1::KeyPair::from_hex("02702ae71ec11a895f6255e26395983585a0d791ea1eb83d1aa54a66056469da");
	assert( std::string(blinding.pub())
	     == "03d1392b64a2c271fbd01b18ddb92358cece976811727975e315bd49321d9c9881"
	      );

	/* Round trip through the serialized forms.  */
	{
		auto s = std::string(kp.priv());
		assert(Secp256k1::PrivKey(s) == kp.priv());
		auto v = kp.pub().to_vector();
		assert(v.size() == 33);
		assert(Secp256k1::PubKey::from_vector(v) == kp.pub());
	}

	/* The shared secret is symmetric.  */
	{
		assert( Secp256k1::ecdh(kp.priv(), blinding.pub())
		     == Secp256k1::ecdh(blinding.priv(), kp.pub())
		      );
		assert( Secp256k1::ecdh(kp.priv(), blinding.pub())
		     != Secp256k1::ecdh(kp.priv(), kp.pub())
		      );
	}

	/* Zero and out-of-range private keys.  */
	{
		auto flag = false;
		try {
			Secp256k1::PrivKey("0000000000000000000000000000000000000000000000000000000000000000");
		} catch (Secp256k1::InvalidPrivKey const&) {
			flag = true;
		}
		assert(flag);

		flag = false;
		try {
			Secp256k1::PrivKey("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141");
		} catch (Secp256k1::InvalidPrivKey const&) {
			flag = true;
		}
		assert(flag);
	}

	/* Public keys must be 33 bytes of a valid point.  */
	{
		auto flag = false;
		try {
			Secp256k1::PubKey::from_vector(std::vector<std::uint8_t>(32, 0x02));
		} catch (Secp256k1::InvalidPubKey const&) {
			flag = true;
		}
		assert(flag);

		flag = false;
		try {
			auto v = kp.pub().to_vector();
			v[0] = 0x05;
			Secp256k1::PubKey::from_vector(v);
		} catch (Secp256k1::InvalidPubKey const&) {
			flag = true;
		}
		assert(flag);
	}

	/* Keys from a random source form a matching pair.  */
	{
		std::uint8_t seed[32] = {7};
		auto rand = Secp256k1::Random(seed);
		auto a = Secp256k1::KeyPair(rand);
		assert(Secp256k1::PubKey(a.priv()) == a.pub());
	}

	return 0;
}
