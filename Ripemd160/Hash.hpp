#ifndef RIPEMD160_HASH_HPP
#define RIPEMD160_HASH_HPP

#include<cstdint>
#include<iostream>
#include<memory>
#include<string>
#include<utility>
#include<vector>

namespace Ripemd160 {

/** class Ripemd160::Hash
 *
 * @brief the 20-byte hash result of RIPEMD160.
 *
 * @desc HTLC hashlocks are stored as this type: a
 * hashlock is the RIPEMD160 of the SHA256 of the
 * swap preimage.
 */
class Hash {
private:
	struct Impl {
		std::uint8_t d[20];
	};
	std::shared_ptr<Impl> pimpl;

public:
	Hash() =default;
	Hash(Hash const&) =default;
	Hash(Hash&&) =default;
	Hash& operator=(Hash const&) =default;
	Hash& operator=(Hash&&) =default;
	~Hash() =default;

	static
	bool valid_string(std::string const&);
	/* Throws `std::invalid_argument` unless given
	 * exactly 40 hex digits.  */
	explicit
	Hash(std::string const&);
	/* Throws `std::invalid_argument` unless given
	 * exactly 20 bytes, as in a script push.  */
	static
	Hash from_vector(std::vector<std::uint8_t> const&);
	std::vector<std::uint8_t> to_vector() const;

	explicit
	operator std::string() const;

	explicit
	operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	bool operator==(Hash const&) const;
	bool operator!=(Hash const& i) const {
		return !(*this == i);
	}

	void to_buffer(std::uint8_t d[20]) const {
		if (pimpl)
			for (auto i = std::size_t(0); i < 20; ++i)
				d[i] = pimpl->d[i];
		else
			for (auto i = std::size_t(0); i < 20; ++i)
				d[i] = 0;
	}
	void from_buffer(std::uint8_t const d[20]) {
		if (!pimpl)
			pimpl = std::make_shared<Impl>();
		for (auto i = std::size_t(0); i < 20; ++i)
			pimpl->d[i] = d[i];
	}
};

inline
std::ostream& operator<<(std::ostream& os, Hash const& i) {
	return os << std::string(i);
}

}

#endif /* !defined(RIPEMD160_HASH_HPP) */
