#ifndef BITCOIN_VARINT_HPP
#define BITCOIN_VARINT_HPP

#include<cstdint>
#include<iostream>

namespace Bitcoin { namespace Detail { class VarIntIn; }}
namespace Bitcoin { namespace Detail { class VarIntOut; }}

namespace Bitcoin {

/** Bitcoin::varint
 *
 * @brief stream adaptor for the `CompactSize`
 * counts and lengths in Elements transactions.
 *
 * @desc
 *
 *     is >> Bitcoin::varint(n);
 *     os << Bitcoin::varint(outputs.size());
 *
 * A modifiable lvalue reads; a constant or a
 * temporary writes.
 * Truncated input sets the stream's failbit,
 * which the transaction parsers check after
 * every structure.
 */
Detail::VarIntIn varint(std::uint64_t& v);
Detail::VarIntOut varint(std::uint64_t const& v);

}

std::ostream& operator<<(std::ostream&, Bitcoin::Detail::VarIntOut);
std::istream& operator>>(std::istream&, Bitcoin::Detail::VarIntIn);

namespace Bitcoin { namespace Detail {

class VarIntIn {
private:
	std::uint64_t& v;
	friend
	std::istream& ::operator>>(std::istream&, Bitcoin::Detail::VarIntIn);
public:
	explicit VarIntIn(std::uint64_t& v_) : v(v_) { }
};

class VarIntOut {
private:
	std::uint64_t v;
	friend
	std::ostream& ::operator<<(std::ostream&, Bitcoin::Detail::VarIntOut);
public:
	explicit VarIntOut(std::uint64_t v_) : v(v_) { }
};

}}

#endif /* !defined(BITCOIN_VARINT_HPP) */
