#include"Elements/Confidential.hpp"
#include"Elements/Network.hpp"

namespace {

Elements::NetworkParams const liquid =
{ "lq", "ex", 57, 39, 12
, "6f0279e9ed041c3d710a9f57d0c02928416460c4b722ae3457a11eec381c526d"
};
Elements::NetworkParams const liquid_testnet =
{ "tlq", "tex", 36, 19, 23
, "144c654344aa716d6f3abcc1ca90e5641e4e2a7f633bc09fe3baf64585819a49"
};

}

namespace Elements {

std::string network_name(Network n) {
	switch (n) {
	case Liquid:
		return "liquid";
	case LiquidTestnet:
		return "liquid-testnet";
	}
	throw UnknownNetwork(std::to_string(int(n)));
}
Network network_from_name(std::string const& s) {
	if (s == "liquid")
		return Liquid;
	if (s == "liquid-testnet")
		return LiquidTestnet;
	throw UnknownNetwork(s);
}

NetworkParams const& params(Network n) {
	switch (n) {
	case Liquid:
		return liquid;
	case LiquidTestnet:
		return liquid_testnet;
	}
	throw UnknownNetwork(std::to_string(int(n)));
}

AssetId policy_asset(Network n) {
	return AssetId(params(n).policy_asset);
}

}
