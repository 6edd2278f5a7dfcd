#include"Electrum/ClientIF.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"

namespace Electrum {

std::string script_hash(std::vector<std::uint8_t> const& scriptPubKey) {
	return Sha256::fun(scriptPubKey).reversed_hex();
}

}
