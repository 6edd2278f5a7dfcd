#ifndef SWAP_SCRIPT_HPP
#define SWAP_SCRIPT_HPP

#include"Electrum/Config.hpp"
#include"Ripemd160/Hash.hpp"
#include"Secp256k1/KeyPair.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Swap/Direction.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Elements { class Address; }

namespace Swap {

/** class Swap::Script
 *
 * @brief the HTLC a swap locks its funds in,
 * together with the key that blinds the lockup
 * output and the server that watches it.
 *
 * @desc Submarine:
 *
 *     OP_HASH160 <hashlock> OP_EQUAL
 *     OP_IF
 *         <receiver>
 *     OP_ELSE
 *         <timelock> OP_CHECKLOCKTIMEVERIFY OP_DROP
 *         <sender>
 *     OP_ENDIF
 *     OP_CHECKSIG
 *
 * Reverse submarine:
 *
 *     OP_SIZE <32> OP_EQUAL
 *     OP_IF
 *         OP_HASH160 <hashlock> OP_EQUALVERIFY
 *         <receiver>
 *     OP_ELSE
 *         OP_DROP
 *         <timelock> OP_CHECKLOCKTIMEVERIFY OP_DROP
 *         <sender>
 *     OP_ENDIF
 *     OP_CHECKSIG
 *
 * The hashlock is RIPEMD160(SHA256(preimage)).
 * An object always has all four fields; anything
 * that cannot produce them throws
 * `Swap::InputError` instead.
 */
class Script {
private:
	Electrum::Config config;
	Direction direction;
	Ripemd160::Hash hashlock;
	Secp256k1::PubKey receiver;
	Secp256k1::PubKey sender;
	std::uint32_t timelock;
	Secp256k1::KeyPair blinding;

public:
	Script() =delete;
	Script(Script const&) =default;
	Script(Script&&) =default;
	Script& operator=(Script const&) =default;
	Script& operator=(Script&&) =default;

	Script( Electrum::Config config
	      , Direction direction
	      , Ripemd160::Hash hashlock
	      , Secp256k1::PubKey receiver
	      , Secp256k1::PubKey sender
	      , std::uint32_t timelock
	      , Secp256k1::KeyPair blinding
	      );

	/** Swap::Script::decode
	 *
	 * @brief recovers the fields of a redeem script
	 * of the given direction.
	 *
	 * @desc Throws `Swap::InputError` if the script
	 * is truncated or any field is missing or
	 * malformed.
	 */
	static
	Script decode( std::vector<std::uint8_t> const& redeem_script
		     , Direction direction
		     , Secp256k1::KeyPair blinding
		     , Electrum::Config config
		     );
	/* `decode` from hex strings.  Malformed hex or
	 * blinding key is a `Swap::InputError`.  */
	static
	Script from_hex( Direction direction
		       , std::string const& redeem_script_hex
		       , std::string const& blinding_privkey_hex
		       , Electrum::Config config
		       );

	std::vector<std::uint8_t> to_script() const;
	/* Confidential lockup address: P2SH-P2WSH for
	 * submarine, P2WSH for reverse submarine.  */
	Elements::Address to_address() const;
	/* `scriptPubKey` of the lockup address.  */
	std::vector<std::uint8_t> lockup_scriptPubKey() const;

	Electrum::Config const& get_config() const { return config; }
	Direction get_direction() const { return direction; }
	Ripemd160::Hash const& get_hashlock() const { return hashlock; }
	Secp256k1::PubKey const& get_receiver() const { return receiver; }
	Secp256k1::PubKey const& get_sender() const { return sender; }
	std::uint32_t get_timelock() const { return timelock; }
	Secp256k1::KeyPair const& get_blinding() const { return blinding; }

	/* Same script on the same network, blinded to
	 * the same key.  The server is not compared.  */
	bool operator==(Script const&) const;
	bool operator!=(Script const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(SWAP_SCRIPT_HPP) */
