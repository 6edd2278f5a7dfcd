#ifndef SWAP_DETAIL_SCRIPTFOLD_HPP
#define SWAP_DETAIL_SCRIPTFOLD_HPP

#include"Ripemd160/Hash.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Swap/Direction.hpp"
#include<cstdint>
#include<memory>
#include<vector>

namespace Bitcoin { struct ScriptInstruction; }

namespace Swap { namespace Detail {

/** struct Swap::Detail::ScriptFields
 *
 * @brief the four values a swap script commits
 * to.
 */
struct ScriptFields {
	Ripemd160::Hash hashlock;
	Secp256k1::PubKey receiver;
	Secp256k1::PubKey sender;
	std::uint32_t timelock;
};

/** class Swap::Detail::ScriptFold
 *
 * @brief recovers the fields of a swap script
 * from its instructions, fed one at a time from
 * left to right.
 *
 * @desc Each data push is assigned according to
 * the opcode seen most recently before it; pushes
 * do not count as "seen" opcodes.
 * A small-integer opcode is a push of its number.
 *
 * Submarine:
 * - after `OP_HASH160`, the hashlock.
 * - after `OP_IF`, the receiver key.
 * - after `OP_ELSE`, the timelock.
 * - after `OP_DROP`, the sender key.
 *
 * Reverse submarine:
 * - after `OP_HASH160`, the hashlock.
 * - after `OP_EQUALVERIFY`, the receiver key.
 * - after `OP_DROP`, the timelock if the push is
 *   a script number (5 bytes or less), else the
 *   sender key.
 *
 * Pushes anywhere else are ignored.
 * `feed` and `finish` throw `Swap::InputError`.
 */
class ScriptFold {
private:
	Direction direction;
	bool have_last;
	std::uint8_t last;

	std::unique_ptr<Ripemd160::Hash> hashlock;
	std::unique_ptr<Secp256k1::PubKey> receiver;
	std::unique_ptr<Secp256k1::PubKey> sender;
	std::unique_ptr<std::uint32_t> timelock;

	void set_hashlock(std::vector<std::uint8_t> const&);
	void set_key( std::unique_ptr<Secp256k1::PubKey>& key
		    , std::vector<std::uint8_t> const&
		    );
	void set_timelock(Bitcoin::ScriptInstruction const&);

public:
	explicit
	ScriptFold(Direction direction_)
		: direction(direction_)
		, have_last(false)
		, last(0)
		{ }

	void feed(Bitcoin::ScriptInstruction const&);

	bool has_hashlock() const { return !!hashlock; }
	bool has_receiver() const { return !!receiver; }
	bool has_sender() const { return !!sender; }
	bool has_timelock() const { return !!timelock; }

	/* Fails if any of the four fields is unset.  */
	ScriptFields finish() const;
};

}}

#endif /* !defined(SWAP_DETAIL_SCRIPTFOLD_HPP) */
