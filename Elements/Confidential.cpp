#include"Bitcoin/le.hpp"
#include"Elements/Confidential.hpp"
#include"Secp256k1/PubKey.hpp"
#include<sstream>

namespace Elements {

ConfidentialAsset ConfidentialAsset::from_asset(AssetId const& a) {
	auto ret = ConfidentialAsset();
	ret.data.resize(33);
	ret.data[0] = 0x01;
	a.to_buffer(&ret.data[1]);
	return ret;
}
ConfidentialAsset
ConfidentialAsset::from_generator(std::vector<std::uint8_t> bytes) {
	auto ret = ConfidentialAsset();
	ret.set_commitment(std::move(bytes));
	return ret;
}
AssetId ConfidentialAsset::get_asset() const {
	if (!is_explicit())
		throw BadConfidentialEncoding("asset is not explicit");
	return AssetId::from_buffer(&data[1]);
}

ConfidentialValue ConfidentialValue::from_amount(std::uint64_t v) {
	auto os = std::ostringstream();
	os.put(0x01);
	os << Bitcoin::be(v);
	auto str = os.str();

	auto ret = ConfidentialValue();
	ret.data = std::vector<std::uint8_t>(str.begin(), str.end());
	return ret;
}
ConfidentialValue
ConfidentialValue::from_commitment(std::vector<std::uint8_t> bytes) {
	auto ret = ConfidentialValue();
	ret.set_commitment(std::move(bytes));
	return ret;
}
std::uint64_t ConfidentialValue::get_amount() const {
	if (!is_explicit())
		throw BadConfidentialEncoding("value is not explicit");
	auto v = std::uint64_t(0);
	for (auto i = std::size_t(1); i < 9; ++i)
		v = (v << 8) | data[i];
	return v;
}

ConfidentialNonce ConfidentialNonce::from_pubkey(Secp256k1::PubKey const& pk) {
	auto ret = ConfidentialNonce();
	ret.data = pk.to_vector();
	return ret;
}
Secp256k1::PubKey ConfidentialNonce::get_pubkey() const {
	if (!is_commitment())
		throw BadConfidentialEncoding("nonce is not a public key");
	return Secp256k1::PubKey::from_vector(data);
}

}

std::ostream& operator<<(std::ostream& os, Elements::ConfidentialAsset const& v) {
	v.write(os);
	return os;
}
std::istream& operator>>(std::istream& is, Elements::ConfidentialAsset& v) {
	v.read(is);
	return is;
}
std::ostream& operator<<(std::ostream& os, Elements::ConfidentialValue const& v) {
	v.write(os);
	return os;
}
std::istream& operator>>(std::istream& is, Elements::ConfidentialValue& v) {
	v.read(is);
	return is;
}
std::ostream& operator<<(std::ostream& os, Elements::ConfidentialNonce const& v) {
	v.write(os);
	return os;
}
std::istream& operator>>(std::istream& is, Elements::ConfidentialNonce& v) {
	v.read(is);
	return is;
}
