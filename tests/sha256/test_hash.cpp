#undef NDEBUG
#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Sha256/HasherStream.hpp"
#include"Sha256/fun.hpp"
#include<assert.h>

int main() {
	auto const hello = Sha256::Hash("2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");

	auto a = Sha256::Hash();
	assert(!a);
	assert(Sha256::Hash::valid_string(std::string(hello)));
	assert(!Sha256::Hash::valid_string("2cf2"));
	assert(!Sha256::Hash("0000000000000000000000000000000000000000000000000000000000000000"));

	/* From sha256sum.  */
	assert(Sha256::fun("hello", 5) == hello);

	auto hasher = Sha256::Hasher();
	hasher.feed("hel", 3);
	hasher.feed("lo", 2);
	assert(std::move(hasher).finalize() == hello);

	/* Crossing the 64-byte block boundary through the stream.  */
	{
		Sha256::HasherStream s;
		s << "the quick brown fox jumps over the lazy dog.";
		s << "the quick brown fox jumps over the lazy dog.";
		assert( std::move(s).finalize()
		     == Sha256::Hash("9d1b19cd5ff6fc857d99a4be13727f12b9bd6a78a1b8519e18737341d2e8f960")
		      );
	}

	/* Double hashing, as used for txids.  */
	{
		auto d = Sha256::double_fun("hello", 5);
		assert(d == Sha256::fun(hello));
		assert( d
		     == Sha256::Hash("9595c9df90075148eb06860365df33584b75bff782a510c6cd4883a419833d50")
		      );
		Sha256::HasherStream s;
		s << "hello";
		assert(std::move(s).finalize_double() == d);
	}

	/* Display order is byte-reversed.  */
	{
		auto h = Sha256::Hash("000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f");
		assert( h.reversed_hex()
		     == "1f1e1d1c1b1a191817161514131211100f0e0d0c0b0a09080706050403020100"
		      );
		assert(Sha256::Hash::from_reversed_hex(h.reversed_hex()) == h);
	}

	return 0;
}
