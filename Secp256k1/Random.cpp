#include<sodium/crypto_stream_chacha20.h>
#include<sodium/randombytes.h>
#include<sodium/utils.h>
#include<string.h>
#include"Secp256k1/Random.hpp"

namespace Secp256k1 {

class Random::Impl {
private:
	unsigned int num;
	std::uint8_t buffer[64];

	bool seeded;
	unsigned char key[crypto_stream_chacha20_ietf_KEYBYTES];
	unsigned char nonce[crypto_stream_chacha20_ietf_NONCEBYTES];

	void refill() {
		if (seeded) {
			crypto_stream_chacha20_ietf(buffer, sizeof(buffer), nonce, key);
			sodium_increment(nonce, sizeof(nonce));
		} else {
			randombytes_buf(buffer, sizeof(buffer));
		}
		num = 0;
	}

public:
	Impl() : num(64), seeded(false) {
		memset(key, 0, sizeof(key));
		memset(nonce, 0, sizeof(nonce));
	}
	explicit Impl(std::uint8_t const seed[32]) : num(64), seeded(true) {
		memcpy(key, seed, sizeof(key));
		memset(nonce, 0, sizeof(nonce));
	}
	~Impl() {
		sodium_memzero(buffer, sizeof(buffer));
		sodium_memzero(key, sizeof(key));
	}
	std::uint8_t get() {
		if (num >= 64)
			refill();
		return buffer[num++];
	}
};

Random::Random() : pimpl(std::make_unique<Impl>()) { }
Random::Random(std::uint8_t const seed[32])
	: pimpl(std::make_unique<Impl>(seed)) { }
Random::~Random() { }

std::uint8_t Random::get() {
	return pimpl->get();
}
void Random::get_bytes(std::uint8_t* buf, std::size_t len) {
	for (auto i = std::size_t(0); i < len; ++i)
		buf[i] = pimpl->get();
}

}
