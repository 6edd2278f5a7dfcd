#undef NDEBUG
#include"Bitcoin/base58.hpp"
#include"Util/Str.hpp"
#include<assert.h>

int main() {
	/* P2PKH of the all-zero hash160.  */
	auto payload = std::vector<std::uint8_t>(21, 0x00);
	assert( Bitcoin::base58check_encode(payload)
	     == "1111111111111111111114oLvT2"
	      );

	auto decoded = std::vector<std::uint8_t>();
	assert(Bitcoin::base58check_decode(decoded, "1111111111111111111114oLvT2"));
	assert(decoded == payload);

	/* Bad checksum.  */
	assert(!Bitcoin::base58check_decode(decoded, "1111111111111111111114oLvT3"));
	/* '0', 'O', 'I' and 'l' are not base58.  */
	assert(!Bitcoin::base58check_decode(decoded, "1111111111111111111114oLvT0"));
	assert(!Bitcoin::base58check_decode(decoded, "Il"));
	/* Shorter than a checksum.  */
	assert(!Bitcoin::base58check_decode(decoded, "1"));

	/* Confidential P2SH shape: blinded prefix, prefix,
	 * 33-byte key, 20-byte hash.  */
	auto conf = std::vector<std::uint8_t>(55, 0x00);
	conf[0] = 23;
	conf[1] = 19;
	conf[2] = 0x02;
	for (auto i = std::size_t(3); i < 55; ++i)
		conf[i] = std::uint8_t(i);
	auto s = Bitcoin::base58check_encode(conf);
	assert(Bitcoin::base58check_decode(decoded, s));
	assert(decoded == conf);

	return 0;
}
