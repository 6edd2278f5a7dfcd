#ifndef ELEMENTS_CONFIDENTIAL_HPP
#define ELEMENTS_CONFIDENTIAL_HPP

#include"Sha256/Hash.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<iostream>
#include<stdexcept>
#include<string>
#include<vector>

namespace Secp256k1 { class PubKey; }

namespace Elements {

/** class Elements::AssetId
 *
 * @brief the 32-byte identifier of an issued
 * asset.
 *
 * @desc Like transaction ids, asset ids are
 * displayed byte-reversed.
 * The string forms here use display order;
 * the buffer forms use wire order.
 */
class AssetId {
private:
	/* Wire order.  */
	Sha256::Hash hash;

public:
	AssetId() =default;
	AssetId(AssetId const&) =default;
	AssetId(AssetId&&) =default;
	AssetId& operator=(AssetId const&) =default;
	AssetId& operator=(AssetId&&) =default;

	explicit
	AssetId(std::string const& display_hex)
		: hash(Sha256::Hash::from_reversed_hex(display_hex)) { }
	explicit
	operator std::string() const {
		return hash.reversed_hex();
	}

	static AssetId from_buffer(std::uint8_t const buf[32]) {
		auto ret = AssetId();
		ret.hash.from_buffer(buf);
		return ret;
	}
	void to_buffer(std::uint8_t buf[32]) const {
		hash.to_buffer(buf);
	}

	bool operator==(AssetId const& o) const {
		return hash == o.hash;
	}
	bool operator!=(AssetId const& o) const {
		return !(*this == o);
	}
};

class BadConfidentialEncoding : public Util::BacktraceException<std::invalid_argument> {
public:
	BadConfidentialEncoding(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"Bad confidential field: " + msg
		  ) { }
};

namespace Detail {

/** class Elements::Detail::Confidential
 *
 * @brief a field that is either null, explicit,
 * or a 33-byte commitment, told apart by its
 * first byte.
 *
 * @desc The stored bytes are the serialization
 * itself, prefix included; null is the empty
 * vector and serializes as the single byte 0x00.
 */
template< std::size_t explicit_size
	, std::uint8_t prefix_a
	, std::uint8_t prefix_b
	>
class Confidential {
protected:
	std::vector<std::uint8_t> data;

public:
	bool is_null() const { return data.empty(); }
	bool is_explicit() const {
		return data.size() == explicit_size && data[0] == 0x01;
	}
	bool is_commitment() const {
		return data.size() == 33
		    && (data[0] == prefix_a || data[0] == prefix_b)
		     ;
	}
	std::vector<std::uint8_t> const& get_bytes() const { return data; }

	bool operator==(Confidential const& o) const {
		return data == o.data;
	}
	bool operator!=(Confidential const& o) const {
		return !(*this == o);
	}

	void write(std::ostream& os) const {
		if (data.empty()) {
			os.put(0x00);
			return;
		}
		for (auto b : data)
			os.put(char(b));
	}
	void read(std::istream& is) {
		data.clear();
		auto c = is.get();
		if (c == std::char_traits<char>::eof()) {
			is.setstate(std::ios_base::failbit);
			return;
		}
		auto prefix = std::uint8_t(c);
		auto size = std::size_t(0);
		if (prefix == 0x00)
			return;
		else if (prefix == 0x01)
			size = explicit_size;
		else if (prefix == prefix_a || prefix == prefix_b)
			size = 33;
		else {
			is.setstate(std::ios_base::failbit);
			return;
		}
		data.resize(size);
		data[0] = prefix;
		for (auto i = std::size_t(1); i < size; ++i)
			data[i] = std::uint8_t(is.get());
	}

protected:
	void set_commitment(std::vector<std::uint8_t> bytes) {
		if ( bytes.size() != 33
		  || (bytes[0] != prefix_a && bytes[0] != prefix_b)
		   )
			throw BadConfidentialEncoding("not a commitment");
		data = std::move(bytes);
	}
};

}

/** class Elements::ConfidentialAsset
 *
 * @brief an output's asset: explicit asset id or
 * blinded generator.
 */
class ConfidentialAsset : public Detail::Confidential<33, 0x0a, 0x0b> {
public:
	static ConfidentialAsset from_asset(AssetId const&);
	/* Takes a serialized secp256k1 generator.  */
	static ConfidentialAsset from_generator(std::vector<std::uint8_t>);

	/* Throws BadConfidentialEncoding unless explicit.  */
	AssetId get_asset() const;
};

/** class Elements::ConfidentialValue
 *
 * @brief an output's amount: explicit value or
 * Pedersen commitment.
 */
class ConfidentialValue : public Detail::Confidential<9, 0x08, 0x09> {
public:
	static ConfidentialValue from_amount(std::uint64_t);
	/* Takes a serialized Pedersen commitment.  */
	static ConfidentialValue from_commitment(std::vector<std::uint8_t>);

	/* Throws BadConfidentialEncoding unless explicit.  */
	std::uint64_t get_amount() const;
};

/** class Elements::ConfidentialNonce
 *
 * @brief an output's nonce.
 * For a blinded output this is the sender's
 * ephemeral ECDH public key.
 */
class ConfidentialNonce : public Detail::Confidential<33, 0x02, 0x03> {
public:
	static ConfidentialNonce from_pubkey(Secp256k1::PubKey const&);

	/* Throws BadConfidentialEncoding unless a public key.  */
	Secp256k1::PubKey get_pubkey() const;
};

}

std::ostream& operator<<(std::ostream&, Elements::ConfidentialAsset const&);
std::istream& operator>>(std::istream&, Elements::ConfidentialAsset&);
std::ostream& operator<<(std::ostream&, Elements::ConfidentialValue const&);
std::istream& operator>>(std::istream&, Elements::ConfidentialValue&);
std::ostream& operator<<(std::ostream&, Elements::ConfidentialNonce const&);
std::istream& operator>>(std::istream&, Elements::ConfidentialNonce&);

#endif /* !defined(ELEMENTS_CONFIDENTIAL_HPP) */
