#undef NDEBUG
#include"Ln/Preimage.hpp"
#include"Ripemd160/Hash.hpp"
#include"Secp256k1/Random.hpp"
#include"Sha256/Hash.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>

int main() {
	/* Absent until given.  */
	{
		auto p = Ln::Preimage();
		assert(!p);
		assert(std::string(p) == "");
		assert(p.to_vector().empty());
		assert(p == Ln::Preimage());
	}

	auto const zeros = std::string("0000000000000000000000000000000000000000000000000000000000000000");
	assert(Ln::Preimage::valid_string(zeros));
	assert(!Ln::Preimage::valid_string("00"));
	assert(!Ln::Preimage::valid_string(std::string(63, '0') + "g"));

	/* A present all-zero preimage is not the absent one.  */
	{
		auto p = Ln::Preimage(zeros);
		assert(!!p);
		assert(p != Ln::Preimage());
		assert(std::string(p) == zeros);
		assert(p.to_vector() == std::vector<std::uint8_t>(32, 0));
		assert( p.sha256()
		     == Sha256::Hash("66687aadf862bd776c8fc18b8e9f8e20089714856ee233b3902a591d0d5f2925")
		      );
		assert( p.hash160()
		     == Ripemd160::Hash("b8bcb07f6344b42ab04250c86a6e8b75d3fdbbc6")
		      );
	}

	/* Wrong length.  */
	{
		auto flag = false;
		try {
			Ln::Preimage("0011");
		} catch (std::invalid_argument const&) {
			flag = true;
		}
		assert(flag);
	}

	/* Random preimages are reproducible from a seed.  */
	{
		std::uint8_t seed[32] = {3};
		auto r1 = Secp256k1::Random(seed);
		auto r2 = Secp256k1::Random(seed);
		auto a = Ln::Preimage(r1);
		auto b = Ln::Preimage(r2);
		assert(a == b);
		assert(a != Ln::Preimage(r1));

		std::uint8_t buf[32];
		a.to_buffer(buf);
		auto c = Ln::Preimage();
		c.from_buffer(buf);
		assert(c == a);
	}

	return 0;
}
