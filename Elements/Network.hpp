#ifndef ELEMENTS_NETWORK_HPP
#define ELEMENTS_NETWORK_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Elements { class AssetId; }

namespace Elements {

/** enum Elements::Network
 *
 * @brief the Elements chains swaps run on.
 */
enum Network
{ Liquid
, LiquidTestnet
};

class UnknownNetwork : public Util::BacktraceException<std::invalid_argument> {
public:
	UnknownNetwork(std::string const& name)
		: Util::BacktraceException<std::invalid_argument>(
			"Unknown network: " + name
		  ) { }
};

/* "liquid" or "liquid-testnet".  */
std::string network_name(Network);
Network network_from_name(std::string const&);

/** struct Elements::NetworkParams
 *
 * @brief address-encoding parameters of a
 * network.
 */
struct NetworkParams {
	/* Human-readable part of confidential segwit
	 * addresses (blech32).  */
	char const* blech32_hrp;
	/* Human-readable part of unconfidential segwit
	 * addresses (bech32).  */
	char const* bech32_hrp;
	std::uint8_t p2pkh_prefix;
	std::uint8_t p2sh_prefix;
	/* Leading byte of confidential base58 addresses,
	 * followed by the unconfidential prefix.  */
	std::uint8_t blinded_prefix;
	/* Display (byte-reversed) hex of the asset fees
	 * are paid in.  */
	char const* policy_asset;
};

NetworkParams const& params(Network);

/* The network's fee asset.  */
AssetId policy_asset(Network);

}

#endif /* !defined(ELEMENTS_NETWORK_HPP) */
