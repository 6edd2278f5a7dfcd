#ifndef ELEMENTS_ADDRESS_HPP
#define ELEMENTS_ADDRESS_HPP

#include"Elements/Network.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Elements {

class InvalidAddress : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidAddress(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"Invalid address: " + msg
		  ) { }
};

/** class Elements::Address
 *
 * @brief a confidential address: a locking script
 * plus the public key senders blind their outputs
 * to.
 *
 * @desc Segwit addresses are blech32 (blech32m for
 * witness versions above 0) with the blinding key
 * in front of the witness program.
 * P2SH and P2PKH addresses are base58check with
 * the network's blinded prefix, then the usual
 * prefix, then the blinding key and the hash.
 *
 * Unconfidential addresses are not accepted.
 */
class Address {
public:
	enum Kind
	{ Segwit
	, P2SH
	, P2PKH
	};

private:
	Network net;
	Kind kind;
	Secp256k1::PubKey blinder;
	/* Witness version for `Segwit`, else 0.  */
	std::uint8_t witver;
	/* Witness program, or the 20-byte hash.  */
	std::vector<std::uint8_t> program;

	Address( Network net_
	       , Kind kind_
	       , Secp256k1::PubKey blinder_
	       , std::uint8_t witver_
	       , std::vector<std::uint8_t> program_
	       ) : net(net_)
		 , kind(kind_)
		 , blinder(std::move(blinder_))
		 , witver(witver_)
		 , program(std::move(program_))
		 { }

public:
	Address() =delete;
	Address(Address const&) =default;
	Address(Address&&) =default;
	Address& operator=(Address const&) =default;
	Address& operator=(Address&&) =default;

	/* Native segwit v0 script-hash address for the
	 * given witness script.  */
	static Address p2wsh( Network
			    , std::vector<std::uint8_t> const& witnessScript
			    , Secp256k1::PubKey const& blinder
			    );
	/* P2SH address wrapping the P2WSH of the given
	 * witness script.  */
	static Address p2sh_p2wsh( Network
				 , std::vector<std::uint8_t> const& witnessScript
				 , Secp256k1::PubKey const& blinder
				 );

	/* Throws InvalidAddress.  */
	static Address parse(std::string const&, Network);

	explicit operator std::string() const;

	Network network() const { return net; }
	Kind get_kind() const { return kind; }
	Secp256k1::PubKey const& blinding_pubkey() const { return blinder; }
	std::vector<std::uint8_t> scriptPubKey() const;

	bool operator==(Address const& o) const {
		return net == o.net
		    && kind == o.kind
		    && blinder == o.blinder
		    && witver == o.witver
		    && program == o.program
		     ;
	}
	bool operator!=(Address const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(ELEMENTS_ADDRESS_HPP) */
