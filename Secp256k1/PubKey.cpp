#include<assert.h>
#include<basicsecure.h>
#include<secp256k1.h>
#include<secp256k1_ecdh.h>
#include<sstream>
#include<string>
#include<string.h>
#include<utility>
#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Util/Str.hpp"

using Secp256k1::Detail::context;

namespace {

/* G = 0279BE667EF9DCBBAC55A06295CE870B07029BFCDB2DCE28D959F2815B16F81798 */
std::uint8_t const g[33] = {
	0x02,
	0x79, 0xBE, 0x66, 0x7E,
	0xF9, 0xDC, 0xBB, 0xAC,
	0x55, 0xA0, 0x62, 0x95,
	0xCE, 0x87, 0x0B, 0x07,
	0x02, 0x9B, 0xFC, 0xDB,
	0x2D, 0xCE, 0x28, 0xD9,
	0x59, 0xF2, 0x81, 0x5B,
	0x16, 0xF8, 0x17, 0x98
};

}

namespace Secp256k1 {

class PubKey::Impl {
public:
	secp256k1_pubkey key;

	explicit Impl(Secp256k1::PrivKey const& sk) {
		auto res = secp256k1_ec_pubkey_create( context.get()
						     , &key
						     , sk.key
						     );
		/* The private key should have been verified.  */
		assert(res == 1);
	}
	Impl(std::uint8_t const buffer[33]) {
		auto res = secp256k1_ec_pubkey_parse( context.get()
						    , &key
						    , buffer
						    , 33
						    );
		if (!res)
			throw InvalidPubKey();
	}
	Impl(Impl const& o) {
		key = o.key;
	}

	bool equal(Impl const& o) const {
		std::uint8_t a[33];
		std::uint8_t b[33];
		to_buffer(a);
		o.to_buffer(b);
		return basicsecure_eq(a, b, sizeof(a));
	}

	void dump(std::ostream& os) const {
		std::uint8_t a[33];
		to_buffer(a);
		os << Util::Str::hexdump(a, sizeof(a));
	}

	void to_buffer(std::uint8_t buffer[33]) const {
		size_t size = 33;
		auto resa = secp256k1_ec_pubkey_serialize( context.get()
							 , buffer
							 , &size
							 , &key
							 , SECP256K1_EC_COMPRESSED
							 );
		assert(resa == 1);
		assert(size == 33);
	}
};

PubKey::PubKey()
	: pimpl(std::make_unique<Impl>(g)) { }

PubKey::PubKey(std::uint8_t const buffer[33])
	: pimpl(std::make_unique<Impl>(buffer)) {}

PubKey::PubKey(std::string const& s) {
	auto buf = Util::Str::hexread(s);
	if (buf.size() != 33)
		throw InvalidPubKey();
	pimpl = std::make_unique<Impl>(&buf[0]);
}
PubKey::operator std::string() const {
	auto os = std::ostringstream();
	pimpl->dump(os);
	return os.str();
}

PubKey::PubKey(Secp256k1::PrivKey const& sk)
	: pimpl(std::make_unique<Impl>(sk)) {}

PubKey::PubKey(PubKey const& o)
	: pimpl(std::make_unique<Impl>(*o.pimpl)) { }
PubKey::PubKey(PubKey&& o) {
	/* Leave the moved-from object as G rather than
	 * empty, so it is still usable.  */
	auto mine = std::make_unique<Impl>(g);
	std::swap(pimpl, mine);
	std::swap(pimpl, o.pimpl);
}
PubKey::~PubKey() { }

void const* PubKey::get_key() const {
	return &pimpl->key;
}

bool PubKey::operator==(PubKey const& o) const {
	return pimpl->equal(*o.pimpl);
}

PubKey PubKey::from_vector(std::vector<std::uint8_t> const& v) {
	if (v.size() != 33)
		throw InvalidPubKey();
	return PubKey(&v[0]);
}

void PubKey::to_buffer(std::uint8_t buffer[33]) const {
	pimpl->to_buffer(buffer);
}
std::vector<std::uint8_t> PubKey::to_vector() const {
	auto rv = std::vector<std::uint8_t>(33);
	pimpl->to_buffer(&rv[0]);
	return rv;
}

Sha256::Hash ecdh(Secp256k1::PrivKey const& sk, Secp256k1::PubKey const& pk) {
	/* The default hash function of secp256k1_ecdh is
	 * SHA256 of the compressed shared point.  */
	std::uint8_t secret[32];
	auto res = secp256k1_ecdh( context.get()
				 , secret
				 , reinterpret_cast<secp256k1_pubkey const*>(pk.get_key())
				 , sk.key
				 , nullptr, nullptr
				 );
	if (!res)
		throw InvalidPubKey();
	auto rv = Sha256::Hash();
	rv.from_buffer(secret);
	basicsecure_clear(secret, sizeof(secret));
	return rv;
}

}

std::ostream& operator<<(std::ostream& os, Secp256k1::PubKey const& pk) {
	pk.pimpl->dump(os);
	return os;
}
