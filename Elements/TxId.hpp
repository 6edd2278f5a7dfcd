#ifndef ELEMENTS_TXID_HPP
#define ELEMENTS_TXID_HPP

#include"Sha256/Hash.hpp"
#include<iostream>

namespace Elements {

/** class Elements::TxId
 *
 * @brief the reverse double-sha256 of the non-witness
 * serialization of a transaction.
 *
 * @desc Same as on Bitcoin: the hash of the
 * serialization without the witness section,
 * displayed in reverse order.
 */
class TxId;
}

/* NOTE: These output in binary.  */
std::ostream& operator<<(std::ostream&, Elements::TxId const&);
std::istream& operator>>(std::istream&, Elements::TxId&);

namespace Elements {

class TxId {
private:
	/* The hash stored here is already in reverse order.  */
	Sha256::Hash hash;

	friend
	std::ostream& ::operator<<(std::ostream&, Elements::TxId const&);
	friend
	std::istream& ::operator>>(std::istream&, Elements::TxId&);
public:
	TxId() =default;
	TxId(TxId const&) =default;
	TxId(TxId&&) =default;
	TxId& operator=(TxId const&) =default;
	TxId& operator=(TxId&&) =default;
	~TxId() =default;

	/* Must be expressed in the expected reversed
	 * order.
	 */
	explicit
	TxId(std::string const& s);
	/* Performs the reversal of bytes.  */
	explicit
	TxId(Sha256::Hash hash_);
	/* Prints out in the reversed order.  */
	explicit
	operator std::string() const;

	bool operator==(Elements::TxId const& o) const {
		return hash == o.hash;
	}
	bool operator!=(Elements::TxId const& o) const {
		return hash != o.hash;
	}
};

}

#endif /* !defined(ELEMENTS_TXID_HPP) */
