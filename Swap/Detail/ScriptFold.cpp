#include"Bitcoin/Script.hpp"
#include"Swap/Detail/ScriptFold.hpp"
#include"Swap/Error.hpp"

namespace {

/* A push small enough to be a `CScriptNum` of
 * a 32-bit locktime.  */
bool is_number_push(Bitcoin::ScriptInstruction const& ins) {
	auto dummy = std::int64_t(0);
	if (Bitcoin::small_int_opcode(dummy, ins.opcode))
		return true;
	return ins.is_push && ins.data.size() <= 5;
}

}

namespace Swap { namespace Detail {

void ScriptFold::set_hashlock(std::vector<std::uint8_t> const& data) {
	if (data.size() != 20)
		throw InputError( "Swap script: hashlock push is "
				+ std::to_string(data.size())
				+ " bytes, expected 20"
				);
	hashlock = std::make_unique<Ripemd160::Hash>(
		Ripemd160::Hash::from_vector(data)
	);
}

void ScriptFold::set_key( std::unique_ptr<Secp256k1::PubKey>& key
			, std::vector<std::uint8_t> const& data
			) {
	try {
		key = std::make_unique<Secp256k1::PubKey>(
			Secp256k1::PubKey::from_vector(data)
		);
	} catch (Secp256k1::InvalidPubKey const&) {
		throw InputError("Swap script: invalid public key push");
	}
}

void ScriptFold::set_timelock(Bitcoin::ScriptInstruction const& ins) {
	auto small = std::int64_t(0);
	if (Bitcoin::small_int_opcode(small, ins.opcode)) {
		if (small < 0)
			throw InputError("Swap script: negative timelock");
		timelock = std::make_unique<std::uint32_t>(
			std::uint32_t(small)
		);
		return;
	}

	auto const& data = ins.data;
	if (data.size() > 5)
		throw InputError("Swap script: timelock push too long");
	if (!data.empty() && (data.back() & 0x80) != 0)
		throw InputError("Swap script: negative timelock");

	auto value = std::uint64_t(0);
	for (auto i = std::size_t(0); i < data.size(); ++i)
		value |= std::uint64_t(data[i]) << (8 * i);
	if (value > 0xFFFFFFFFULL)
		throw InputError("Swap script: timelock exceeds 32 bits");

	timelock = std::make_unique<std::uint32_t>(std::uint32_t(value));
}

void ScriptFold::feed(Bitcoin::ScriptInstruction const& ins) {
	auto small = std::int64_t(0);
	auto is_push = ins.is_push
		    || Bitcoin::small_int_opcode(small, ins.opcode)
		     ;
	if (!is_push) {
		have_last = true;
		last = ins.opcode;
		return;
	}
	if (!have_last)
		return;

	switch (direction) {
	case Submarine:
		switch (last) {
		case Bitcoin::OP_HASH160:
			set_hashlock(ins.data);
			break;
		case Bitcoin::OP_IF:
			set_key(receiver, ins.data);
			break;
		case Bitcoin::OP_ELSE:
			set_timelock(ins);
			break;
		case Bitcoin::OP_DROP:
			set_key(sender, ins.data);
			break;
		default:
			break;
		}
		return;
	case ReverseSubmarine:
		switch (last) {
		case Bitcoin::OP_HASH160:
			set_hashlock(ins.data);
			break;
		case Bitcoin::OP_EQUALVERIFY:
			set_key(receiver, ins.data);
			break;
		case Bitcoin::OP_DROP:
			if (is_number_push(ins))
				set_timelock(ins);
			else
				set_key(sender, ins.data);
			break;
		default:
			break;
		}
		return;
	}
}

ScriptFields ScriptFold::finish() const {
	auto missing = std::string();
	auto add = [&missing](char const* name) {
		if (!missing.empty())
			missing += ", ";
		missing += name;
	};
	if (!hashlock)
		add("hashlock");
	if (!receiver)
		add("receiver key");
	if (!timelock)
		add("timelock");
	if (!sender)
		add("sender key");
	if (!missing.empty())
		throw InputError("Swap script: could not find " + missing);

	auto ret = ScriptFields();
	ret.hashlock = *hashlock;
	ret.receiver = *receiver;
	ret.sender = *sender;
	ret.timelock = *timelock;
	return ret;
}

}}
