#ifndef BITCOIN_VARBYTES_HPP
#define BITCOIN_VARBYTES_HPP

#include<cstdint>
#include<iostream>
#include<vector>

namespace Bitcoin { namespace Detail { class VarBytes; }}
namespace Bitcoin { namespace Detail { class VarBytesConst; }}

namespace Bitcoin {

/** Bitcoin::varbytes
 *
 * @brief wraps a byte vector so that it is
 * serialized as a `CompactSize` length followed
 * by the bytes themselves.
 *
 * @desc intended use is:
 *
 *     os << Bitcoin::varbytes(scriptPubKey);
 *     is >> Bitcoin::varbytes(scriptPubKey);
 *
 * On input, a length that exceeds what any
 * transaction could carry sets the failbit
 * instead of allocating.
 */
Detail::VarBytes varbytes(std::vector<std::uint8_t>& v);
Detail::VarBytesConst varbytes(std::vector<std::uint8_t> const& v);

}

std::ostream& operator<<(std::ostream&, Bitcoin::Detail::VarBytesConst);
std::istream& operator>>(std::istream&, Bitcoin::Detail::VarBytes);

namespace Bitcoin { namespace Detail {

class VarBytesConst {
private:
	std::vector<std::uint8_t> const& v;

	friend
	std::ostream& ::operator<<(std::ostream&, Bitcoin::Detail::VarBytesConst);

public:
	VarBytesConst(std::vector<std::uint8_t> const& v_) : v(v_) { }
};

class VarBytes {
private:
	std::vector<std::uint8_t>& v;

	friend
	std::istream& ::operator>>(std::istream&, Bitcoin::Detail::VarBytes);

public:
	VarBytes(std::vector<std::uint8_t>& v_) : v(v_) { }
	operator VarBytesConst() const { return VarBytesConst(v); }
};

}}

#endif /* !defined(BITCOIN_VARBYTES_HPP) */
