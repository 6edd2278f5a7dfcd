#ifndef BITCOIN_SCRIPT_HPP
#define BITCOIN_SCRIPT_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Bitcoin {

/* Only the opcodes the swap scripts, their
 * addresses, and their tests need.  */
enum Opcode
{ OP_0 = 0x00
, OP_PUSHDATA1 = 0x4c
, OP_PUSHDATA2 = 0x4d
, OP_PUSHDATA4 = 0x4e
, OP_1NEGATE = 0x4f
, OP_1 = 0x51
, OP_16 = 0x60
, OP_IF = 0x63
, OP_NOTIF = 0x64
, OP_ELSE = 0x67
, OP_ENDIF = 0x68
, OP_VERIFY = 0x69
, OP_RETURN = 0x6a
, OP_DROP = 0x75
, OP_DUP = 0x76
, OP_SIZE = 0x82
, OP_EQUAL = 0x87
, OP_EQUALVERIFY = 0x88
, OP_0NOTEQUAL = 0x92
, OP_HASH160 = 0xa9
, OP_CHECKSIG = 0xac
, OP_CHECKLOCKTIMEVERIFY = 0xb1
};

/** Bitcoin::MalformedScript
 *
 * @brief thrown when a script cannot be split
 * into instructions, i.e. a push runs past the
 * end of the script.
 */
class MalformedScript : public Util::BacktraceException<std::invalid_argument> {
public:
	MalformedScript(std::string const& e
		       ) : Util::BacktraceException<std::invalid_argument>(
				"Malformed script: " + e
			   ) { }
};

/** struct Bitcoin::ScriptInstruction
 *
 * @brief a single opcode, plus the data it pushes
 * if it is a data push (`OP_0` and direct pushes
 * up to `OP_PUSHDATA4`).
 */
struct ScriptInstruction {
	std::uint8_t opcode;
	bool is_push;
	std::vector<std::uint8_t> data;
};

/** class Bitcoin::ScriptReader
 *
 * @brief splits a script into instructions,
 * left to right.
 */
class ScriptReader {
private:
	std::vector<std::uint8_t> const& script;
	std::size_t pos;

public:
	explicit
	ScriptReader(std::vector<std::uint8_t> const& script_
		    ) : script(script_), pos(0) { }

	bool at_end() const { return pos >= script.size(); }
	/* Throws MalformedScript on a truncated push.  */
	ScriptInstruction next();
};

/** Bitcoin::small_int_opcode
 *
 * @brief if the opcode is `OP_1` to `OP_16` or
 * `OP_1NEGATE`, writes the number it pushes and
 * returns true.
 */
bool small_int_opcode(std::int64_t& value, std::uint8_t opcode);

/** Bitcoin::script_num
 *
 * @brief the minimal `CScriptNum` encoding of the
 * given number: little-endian, with a sign bit in
 * the top byte.  Zero is the empty vector.
 */
std::vector<std::uint8_t> script_num(std::int64_t);

/** class Bitcoin::ScriptBuilder
 *
 * @brief builds a script with minimal pushes.
 */
class ScriptBuilder {
private:
	std::vector<std::uint8_t> script;

public:
	ScriptBuilder& op(Opcode);
	ScriptBuilder& push(std::vector<std::uint8_t> const&);
	/* Small integers become OP_0, OP_1..OP_16 or
	 * OP_1NEGATE, as `push_int` does in bitcoind.  */
	ScriptBuilder& push_int(std::int64_t);

	std::vector<std::uint8_t> const& get() const { return script; }
};

}

#endif /* !defined(BITCOIN_SCRIPT_HPP) */
