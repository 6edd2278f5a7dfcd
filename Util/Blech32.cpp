#include"Util/Blech32.hpp"
#include<algorithm>
#include<ctype.h>

namespace {

auto const charset = std::string("qpzry9x8gf2tvdw0s3jn54khce6mua7l");

/* Blech32 has a 12-character checksum, computed with a
 * degree-12 generator instead of the degree-6 one of
 * bech32.
 */
auto const checksum_length = std::size_t(12);

std::uint64_t const blech32_const = 1;
std::uint64_t const blech32m_const = 0x455972a3350f7a1ULL;

/* Confidential addresses carry a 33-byte blinding key,
 * so the usual 90-character limit does not apply.
 */
auto const max_length = std::size_t(1000);

int decode_char(char c) {
	auto it = std::find( charset.begin(), charset.end()
			   , tolower(c)
			   );
	if (it == charset.end()) {
		return -1;
	}
	return it - charset.begin();
}

std::uint64_t polymod(std::vector<std::uint8_t> const& v) {
	auto c = std::uint64_t(1);
	for (auto v_i : v) {
		auto c0 = std::uint8_t(c >> 55);
		c = ((c & 0x7fffffffffffffULL) << 5) ^ v_i;
		if (c0 & 1)  c ^= 0x7d52fba40bd886ULL;
		if (c0 & 2)  c ^= 0x5e8dbf1a03950cULL;
		if (c0 & 4)  c ^= 0x1c3a3c74072a18ULL;
		if (c0 & 8)  c ^= 0x385d72fa0e5139ULL;
		if (c0 & 16) c ^= 0x7093e5a608865bULL;
	}
	return c;
}

std::vector<std::uint8_t> expand_hrp(std::string const& hrp) {
	auto ret = std::vector<std::uint8_t>();
	ret.reserve(hrp.size() * 2 + 1);
	for (auto c : hrp)
		ret.push_back(std::uint8_t(c) >> 5);
	ret.push_back(0);
	for (auto c : hrp)
		ret.push_back(std::uint8_t(c) & 31);
	return ret;
}

std::uint64_t constant_of(Util::Blech32::Variant variant) {
	switch (variant) {
	case Util::Blech32::BLECH32: return blech32_const;
	case Util::Blech32::BLECH32M: return blech32m_const;
	}
	return blech32_const;
}

}

namespace Util { namespace Blech32 {

std::string encode( Variant variant
		  , std::string const& hrp
		  , std::vector<std::uint8_t> const& values
		  ) {
	auto enc = expand_hrp(hrp);
	enc.insert(enc.end(), values.begin(), values.end());
	enc.resize(enc.size() + checksum_length, 0);
	auto mod = polymod(enc) ^ constant_of(variant);

	auto ret = hrp + "1";
	for (auto v : values)
		ret.push_back(charset[v & 31]);
	for (auto i = std::size_t(0); i < checksum_length; ++i)
		ret.push_back(charset[(mod >> (5 * (11 - i))) & 31]);
	return ret;
}

bool decode( Variant& variant
	   , std::string& hrp
	   , std::vector<std::uint8_t>& values
	   , std::string const& blech32
	   ) {
	if (blech32.size() > max_length)
		return false;

	/* Mixed case is not allowed.  */
	auto has_lower = std::any_of( blech32.begin(), blech32.end()
				    , [](char c) {
		return 'a' <= c && c <= 'z';
	});
	auto has_upper = std::any_of( blech32.begin(), blech32.end()
				    , [](char c) {
		return 'A' <= c && c <= 'Z';
	});
	if (has_lower && has_upper)
		return false;

	/* The last `1` character is the separator.  */
	auto rit = std::find(blech32.rbegin(), blech32.rend(), '1');
	if (rit == blech32.rend())
		return false;
	auto it = rit.base();
	/* Empty HRP, or data part too short for the checksum.  */
	if (it - 1 == blech32.begin())
		return false;
	if (std::size_t(blech32.end() - it) < checksum_length)
		return false;

	hrp.resize(it - 1 - blech32.begin());
	std::transform( blech32.begin(), it - 1
		      , hrp.begin()
		      , [](char c) {
		return char(tolower(c));
	});
	for (auto c : hrp)
		if (c < 33 || c > 126)
			return false;

	auto data = std::vector<std::uint8_t>();
	for (auto p = it; p != blech32.end(); ++p) {
		auto val = decode_char(*p);
		if (val < 0)
			return false;
		data.push_back(std::uint8_t(val));
	}

	auto check = expand_hrp(hrp);
	check.insert(check.end(), data.begin(), data.end());
	auto mod = polymod(check);
	if (mod == blech32_const)
		variant = BLECH32;
	else if (mod == blech32m_const)
		variant = BLECH32M;
	else
		return false;

	values.assign(data.begin(), data.end() - checksum_length);
	return true;
}

}}
