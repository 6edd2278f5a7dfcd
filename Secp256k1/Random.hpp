#ifndef SECP256K1_RANDOM_HPP
#define SECP256K1_RANDOM_HPP

#include<cstddef>
#include<cstdint>
#include<memory>

namespace Secp256k1 {

/** class Secp256k1::Random
 *
 * @brief A source of random data.
 *
 * @desc The default constructor draws from the
 * operating system via libsodium.
 * The seeded constructor gives a deterministic
 * ChaCha20 keystream instead, for tests that need
 * reproducible blinding factors and nonces.
 *
 * Instances cannot be copied: every claim gets a
 * source of its own so no state is shared.
 */
class Random {
private:
	class Impl;

	std::unique_ptr<Impl> pimpl;

public:
	Random();
	explicit Random(std::uint8_t const seed[32]);
	Random(Random&&) =delete;
	Random(Random const&) =delete;
	~Random();

	std::uint8_t get();
	void get_bytes(std::uint8_t* buf, std::size_t len);
};

}

#endif /* SECP256K1_RANDOM_HPP */
