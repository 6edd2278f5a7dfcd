#undef NDEBUG
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<string>
#include<vector>

namespace {

std::string draw(Secp256k1::Random& r, std::size_t n) {
	auto buf = std::vector<std::uint8_t>(n);
	r.get_bytes(&buf[0], n);
	return Util::Str::hexdump(buf);
}

}

int main() {
	std::uint8_t zero[32] = {0};
	std::uint8_t one[32] = {0};
	one[0] = 1;

	/* All-zero key and nonce, from the ChaCha20 test vectors.  */
	{
		auto r = Secp256k1::Random(zero);
		assert(draw(r, 8) == "76b8e0ada0f13d90");
		/* Skip to the end of the first block.  */
		draw(r, 56);
		/* Second block uses the next nonce.  */
		assert(draw(r, 8) == "3db41d3aa0d32928");
	}

	/* Same seed, same stream, regardless of how it is chopped.  */
	{
		auto a = Secp256k1::Random(zero);
		auto b = Secp256k1::Random(zero);
		auto sa = draw(a, 100);
		auto sb = std::string();
		for (auto i = 0; i < 100; ++i)
			sb += Util::Str::hexbyte(b.get());
		assert(sa == sb);
	}

	/* Different seeds diverge.  */
	{
		auto a = Secp256k1::Random(zero);
		auto b = Secp256k1::Random(one);
		assert(draw(a, 32) != draw(b, 32));
	}

	/* Keys drawn from a seeded source are reproducible.  */
	{
		auto a = Secp256k1::Random(one);
		auto b = Secp256k1::Random(one);
		assert(Secp256k1::PrivKey(a) == Secp256k1::PrivKey(b));
		assert(Secp256k1::PrivKey(a) != Secp256k1::PrivKey(a));
	}

	/* The system source works and does not repeat.  */
	{
		auto r = Secp256k1::Random();
		assert(draw(r, 32) != draw(r, 32));
	}

	return 0;
}
