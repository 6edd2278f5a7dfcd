#ifndef ELEMENTS_TX_HPP
#define ELEMENTS_TX_HPP

#include"Elements/TxIn.hpp"
#include"Elements/TxOut.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Elements { class TxId; }

namespace Elements {

class TxParseError : public Util::BacktraceException<std::invalid_argument> {
public:
	TxParseError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"Elements::Tx: " + msg
		  ) { }
};

/** struct Elements::Tx
 *
 * @brief represents a complete Elements
 * transaction.
 *
 * @desc Serialized as
 * `nVersion | flag | vin | vout | nLockTime`
 * followed, if the flag byte is 1, by every input
 * witness then every output witness.
 * The flag is 1 exactly when some input or output
 * has a non-empty witness.
 */
struct Tx {
	std::uint32_t nVersion;
	std::vector<TxIn> inputs;
	std::vector<TxOut> outputs;
	std::uint32_t nLockTime;

	Elements::TxId get_txid() const;

	bool has_witness() const;

	Tx() : nVersion(2), nLockTime(0) { }

	/* Throws TxParseError.  */
	explicit
	Tx(std::string const&);
	static Tx from_bytes(std::vector<std::uint8_t> const&);

	/* Hex of the full serialization.  */
	explicit
	operator std::string() const;
	std::vector<std::uint8_t> to_bytes() const;

	/* Size with witness discounted, rounded up.  */
	std::size_t vsize() const;
};

}

std::ostream& operator<<(std::ostream&, Elements::Tx const&);
std::istream& operator>>(std::istream&, Elements::Tx&);

#endif /* !defined(ELEMENTS_TX_HPP) */
