#undef NDEBUG
#include"Electrum/Config.hpp"
#include<assert.h>

int main() {
	auto l = Electrum::Config::default_liquid();
	assert(l.network == Elements::Liquid);
	assert(l.electrum_url == "blockstream.info:995");
	assert(l.tls);
	assert(l.validate_domain);
	assert(l.proxy == "");

	auto t = Electrum::Config::default_for(Elements::LiquidTestnet);
	assert(t.network == Elements::LiquidTestnet);
	assert(t.electrum_url == "blockstream.info:465");
	assert(t.tls);

	/* Everything is explicit and per-instance.  */
	auto c = Electrum::Config( Elements::LiquidTestnet, "localhost:50001"
				 , false, false, "127.0.0.1:9050", 5
				 );
	assert(!c.tls);
	assert(!c.validate_domain);
	assert(c.proxy == "127.0.0.1:9050");
	assert(c.timeout == 5);
	assert(Electrum::Config::default_liquid_testnet().electrum_url == "blockstream.info:465");

	return 0;
}
