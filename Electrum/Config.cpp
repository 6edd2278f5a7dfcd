#include"Electrum/Config.hpp"

namespace Electrum {

Config Config::default_liquid() {
	return Config(Elements::Liquid, "blockstream.info:995");
}
Config Config::default_liquid_testnet() {
	return Config(Elements::LiquidTestnet, "blockstream.info:465");
}
Config Config::default_for(Elements::Network n) {
	switch (n) {
	case Elements::Liquid:
		return default_liquid();
	case Elements::LiquidTestnet:
		return default_liquid_testnet();
	}
	throw Elements::UnknownNetwork(std::to_string(int(n)));
}

}
