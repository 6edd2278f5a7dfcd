#ifndef BITCOIN_BASE58_HPP
#define BITCOIN_BASE58_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Bitcoin {

/** Bitcoin::base58check_encode
 *
 * @brief encode the payload with a 4-byte
 * double-SHA256 checksum appended.
 */
std::string base58check_encode(std::vector<std::uint8_t> const& payload);

/** Bitcoin::base58check_decode
 *
 * @brief decode a base58check string.
 *
 * @return false if the string has non-base58
 * characters, is too short, or fails the
 * checksum.
 */
bool base58check_decode( std::vector<std::uint8_t>& payload
		       , std::string const& s
		       );

}

#endif /* !defined(BITCOIN_BASE58_HPP) */
