#undef NDEBUG
#include"Elements/Confidential.hpp"
#include"Elements/Network.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<sstream>
#include<string>

namespace {

template<typename T>
std::string dump(T const& v) {
	auto os = std::ostringstream();
	os << v;
	auto s = os.str();
	return Util::Str::hexdump(s.data(), s.size());
}
template<typename T>
T load(std::string const& hex) {
	auto buf = Util::Str::hexread(hex);
	auto is = std::istringstream(std::string(buf.begin(), buf.end()));
	auto v = T();
	is >> v;
	assert(is);
	return v;
}

}

int main() {
	/* Asset ids display byte-reversed.  */
	{
		auto a = Elements::policy_asset(Elements::Liquid);
		assert(std::string(a) == "6f0279e9ed041c3d710a9f57d0c02928416460c4b722ae3457a11eec381c526d");
		auto ca = Elements::ConfidentialAsset::from_asset(a);
		assert(ca.is_explicit());
		assert(!ca.is_commitment());
		assert(dump(ca) == "016d521c38ec1ea15734ae22b7c46064412829c0d0579f0a713d1c04ede979026f");
		assert(ca.get_asset() == a);
		assert(load<Elements::ConfidentialAsset>(dump(ca)) == ca);
		assert(Elements::policy_asset(Elements::LiquidTestnet) != a);
	}

	/* Explicit values are big-endian.  */
	{
		auto v = Elements::ConfidentialValue::from_amount(100000);
		assert(dump(v) == "0100000000000186a0");
		assert(v.get_amount() == 100000);
		assert(load<Elements::ConfidentialValue>("0100000000000186a0") == v);
	}

	/* Null fields serialize as a single zero byte.  */
	{
		auto n = Elements::ConfidentialNonce();
		assert(n.is_null());
		assert(dump(n) == "00");
		assert(load<Elements::ConfidentialNonce>("00").is_null());
	}

	/* Commitments keep their prefix.  */
	{
		auto pk = Secp256k1::PubKey(Secp256k1::PrivKey("aecbc2bddfcd3fa6953d257a9f369dc20cdc66f2605c73efb4c91b90703506b6"));
		auto n = Elements::ConfidentialNonce::from_pubkey(pk);
		assert(n.is_commitment());
		assert(dump(n) == std::string(pk));
		assert(n.get_pubkey() == pk);

		auto bytes = pk.to_vector();
		bytes[0] = 0x09;
		auto v = Elements::ConfidentialValue::from_commitment(bytes);
		assert(v.is_commitment());
		assert(!v.is_explicit());
		assert(load<Elements::ConfidentialValue>(dump(v)) == v);

		auto flag = false;
		try {
			v.get_amount();
		} catch (Elements::BadConfidentialEncoding const&) {
			flag = true;
		}
		assert(flag);

		/* A value commitment cannot pass as a generator.  */
		flag = false;
		try {
			Elements::ConfidentialAsset::from_generator(bytes);
		} catch (Elements::BadConfidentialEncoding const&) {
			flag = true;
		}
		assert(flag);
	}

	/* Unknown prefixes fail the stream.  */
	{
		auto buf = Util::Str::hexread("05");
		auto is = std::istringstream(std::string(buf.begin(), buf.end()));
		auto v = Elements::ConfidentialValue();
		is >> v;
		assert(!is);
	}

	/* Network names.  */
	{
		assert(Elements::network_name(Elements::Liquid) == "liquid");
		assert(Elements::network_from_name("liquid-testnet") == Elements::LiquidTestnet);
		auto flag = false;
		try {
			Elements::network_from_name("regtest");
		} catch (Elements::UnknownNetwork const&) {
			flag = true;
		}
		assert(flag);
	}

	return 0;
}
