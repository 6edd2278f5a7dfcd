#include"Bitcoin/hash160.hpp"
#include"Ripemd160/Hash.hpp"
#include"Ripemd160/fun.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"

namespace Bitcoin {

Ripemd160::Hash hash160(void const* p, std::size_t len) {
	std::uint8_t buf[32];
	Sha256::fun(p, len).to_buffer(buf);
	return Ripemd160::fun(buf, sizeof(buf));
}
Ripemd160::Hash hash160(std::vector<std::uint8_t> const& v) {
	return hash160(v.data(), v.size());
}

}
