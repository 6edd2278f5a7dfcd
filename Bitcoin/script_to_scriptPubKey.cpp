#include"Bitcoin/hash160.hpp"
#include"Bitcoin/script_to_scriptPubKey.hpp"
#include"Ripemd160/Hash.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"

namespace Bitcoin {

std::vector<std::uint8_t>
p2wsh_scriptPubKey(std::vector<std::uint8_t> const& witnessScript) {
	auto rv = std::vector<std::uint8_t>(34);
	rv[0] = 0x00; /* OP_0, denoting segwit v0 */
	rv[1] = 0x20; /* push of the 32-byte script hash */
	Sha256::fun(witnessScript).to_buffer(&rv[2]);
	return rv;
}

std::vector<std::uint8_t>
p2sh_scriptPubKey(std::vector<std::uint8_t> const& redeemScript) {
	auto rv = std::vector<std::uint8_t>(23);
	rv[0] = 0xa9; /* OP_HASH160 */
	rv[1] = 0x14;
	Bitcoin::hash160(redeemScript).to_buffer(&rv[2]);
	rv[22] = 0x87; /* OP_EQUAL */
	return rv;
}

}
