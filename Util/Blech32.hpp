#ifndef UTIL_BLECH32_HPP
#define UTIL_BLECH32_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Util { namespace Blech32 {

/** Util::Blech32::Variant
 *
 * @brief which checksum constant is in force.
 * Segwit version 0 uses plain blech32, later
 * versions use blech32m.
 */
enum Variant
{ BLECH32
, BLECH32M
};

/** Util::Blech32::encode
 *
 * @brief encode 5-bit values under the given
 * human-readable part, appending the 12-character
 * blech32 checksum.
 */
std::string encode( Variant variant
		  , std::string const& hrp
		  , std::vector<std::uint8_t> const& values
		  );

/** Util::Blech32::decode
 *
 * @brief decode a blech32 string.
 *
 * @return true if decoding succeeded.
 *
 * @desc Unlike the bech32 decoder used for addresses
 * that come from other software, this one checks the
 * checksum: confidential addresses are typed in and
 * pasted around by users, and a mangled blinding key
 * would make the funds unrecoverable.
 *
 * On success, `values` holds the 5-bit values of the
 * data part without the checksum.
 */
bool decode( Variant& variant
	   , std::string& hrp
	   , std::vector<std::uint8_t>& values
	   , std::string const& blech32
	   );

/** Util::Blech32::convert_bits
 *
 * @brief regroup a sequence of `frombits`-bit values
 * into `tobits`-bit values, big-endian bit order.
 *
 * @return false if `pad` is not set and there are
 * leftover nonzero bits, or leftover bits that do not
 * fit a whole input group.
 */
template<int frombits, int tobits, bool pad, typename OIt, typename It>
bool convert_bits(OIt oit, It b, It e) {
	auto acc = std::uint32_t(0);
	auto bits = 0;
	auto const maxv = std::uint32_t((1 << tobits) - 1);
	auto const max_acc = std::uint32_t((1 << (frombits + tobits - 1)) - 1);
	for (; b != e; ++b) {
		auto v = std::uint32_t(*b);
		if ((v >> frombits) != 0)
			return false;
		acc = ((acc << frombits) | v) & max_acc;
		bits += frombits;
		while (bits >= tobits) {
			bits -= tobits;
			*oit = std::uint8_t((acc >> bits) & maxv);
			++oit;
		}
	}
	if (pad) {
		if (bits != 0) {
			*oit = std::uint8_t((acc << (tobits - bits)) & maxv);
			++oit;
		}
	} else if (bits >= frombits || ((acc << (tobits - bits)) & maxv) != 0) {
		return false;
	}
	return true;
}

}}

#endif /* !defined(UTIL_BLECH32_HPP) */
