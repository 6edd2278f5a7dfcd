#ifndef BITCOIN_LE_HPP
#define BITCOIN_LE_HPP

#include<cstdint>
#include<iostream>

namespace Bitcoin { namespace Detail { class Le32; }}
namespace Bitcoin { namespace Detail { class Le32Const; }}
namespace Bitcoin { namespace Detail { class Le64; }}
namespace Bitcoin { namespace Detail { class Le64Const; }}
namespace Bitcoin { namespace Detail { class Be64; }}
namespace Bitcoin { namespace Detail { class Be64Const; }}

namespace Bitcoin {

/** Bitcoin::le
 *
 * @brief wraps a uint64, uint32, or int32 so it
 * is encoded in little-endian form.
 *
 * @desc intended use is:
 *
 *     std::cout << Bitcoin::le(expr);
 *     std::cin >> Bitcoin::le(var);
 */
Detail::Le32 le(std::uint32_t& v);
Detail::Le32Const le(std::uint32_t const& v);
Detail::Le32 le(std::int32_t& v);
Detail::Le32Const le(std::int32_t const& v);
Detail::Le64 le(std::uint64_t& v);
Detail::Le64Const le(std::uint64_t const& v);

/** Bitcoin::be
 *
 * @brief wraps a uint64 so it is encoded in
 * big-endian form.
 *
 * @desc Elements serializes explicit amounts
 * big-endian, unlike every other integer on
 * the wire.
 */
Detail::Be64 be(std::uint64_t& v);
Detail::Be64Const be(std::uint64_t const& v);

}

std::ostream& operator<<(std::ostream&, Bitcoin::Detail::Le32Const);
std::ostream& operator<<(std::ostream&, Bitcoin::Detail::Le64Const);
std::ostream& operator<<(std::ostream&, Bitcoin::Detail::Be64Const);
std::istream& operator>>(std::istream&, Bitcoin::Detail::Le32);
std::istream& operator>>(std::istream&, Bitcoin::Detail::Le64);
std::istream& operator>>(std::istream&, Bitcoin::Detail::Be64);

namespace Bitcoin { namespace Detail {

class Le32Const {
private:
	std::uint32_t v;

	friend
	std::ostream& ::operator<<(std::ostream&, Bitcoin::Detail::Le32Const);

public:
	Le32Const(std::uint32_t const& v_) : v(v_) { }
};

class Le32 {
private:
	std::uint32_t& v;

	friend
	std::istream& ::operator>>(std::istream&, Bitcoin::Detail::Le32);

public:
	Le32(std::uint32_t& v_) : v(v_) { }
	operator Le32Const() const { return Le32Const(v); }
};

class Le64Const {
private:
	std::uint64_t v;

	friend
	std::ostream& ::operator<<(std::ostream&, Bitcoin::Detail::Le64Const);

public:
	Le64Const(std::uint64_t const& v_) : v(v_) { }
};

class Le64 {
private:
	std::uint64_t& v;

	friend
	std::istream& ::operator>>(std::istream&, Bitcoin::Detail::Le64);

public:
	Le64(std::uint64_t& v_) : v(v_) { }
	operator Le64Const() const { return Le64Const(v); }
};

class Be64Const {
private:
	std::uint64_t v;

	friend
	std::ostream& ::operator<<(std::ostream&, Bitcoin::Detail::Be64Const);

public:
	Be64Const(std::uint64_t const& v_) : v(v_) { }
};

class Be64 {
private:
	std::uint64_t& v;

	friend
	std::istream& ::operator>>(std::istream&, Bitcoin::Detail::Be64);

public:
	Be64(std::uint64_t& v_) : v(v_) { }
	operator Be64Const() const { return Be64Const(v); }
};

}}

#endif /* !defined(BITCOIN_LE_HPP) */
