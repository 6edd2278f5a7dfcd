#undef NDEBUG
#include"Bitcoin/Script.hpp"
#include"Swap/Detail/ScriptFold.hpp"
#include"Swap/Error.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<string>
#include<vector>

using Swap::Detail::ScriptFold;

namespace {

auto const hashlock = Util::Str::hexread("2bdd03d431251598f46a625f1d3abfcd7f491535");
auto const receiver = Util::Str::hexread("02ccbab5f97c89afb97d814831c5355ef5ba96a18c9dcd1b5c8cfd42c697bfe53c");
auto const sender = Util::Str::hexread("03fced00385bd14b174a571d88b4b6aced2cb1d532237c29c4ec61338fbb7eff40");

Bitcoin::ScriptInstruction op(Bitcoin::Opcode o) {
	return Bitcoin::ScriptInstruction{std::uint8_t(o), false, {}};
}
Bitcoin::ScriptInstruction push(std::vector<std::uint8_t> data) {
	auto opcode = std::uint8_t(data.size() <= 75 ? data.size() : Bitcoin::OP_PUSHDATA1);
	return Bitcoin::ScriptInstruction{opcode, true, std::move(data)};
}

void feed_all(ScriptFold& fold, std::vector<Bitcoin::ScriptInstruction> const& ins) {
	for (auto const& i : ins)
		fold.feed(i);
}

/* Returns the InputError message, or empty if none.  */
std::string input_error( Swap::Direction dir
		       , std::vector<Bitcoin::ScriptInstruction> const& ins
		       ) {
	try {
		auto fold = ScriptFold(dir);
		feed_all(fold, ins);
		fold.finish();
	} catch (Swap::InputError const& e) {
		assert(e.kind() == Swap::Input);
		return e.what();
	}
	return "";
}

std::vector<Bitcoin::ScriptInstruction>
reverse_script(Bitcoin::ScriptInstruction timelock) {
	return { op(Bitcoin::OP_SIZE), push({0x20}), op(Bitcoin::OP_EQUAL)
	       , op(Bitcoin::OP_IF)
	       , op(Bitcoin::OP_HASH160), push(hashlock), op(Bitcoin::OP_EQUALVERIFY)
	       , push(receiver)
	       , op(Bitcoin::OP_ELSE)
	       , op(Bitcoin::OP_DROP)
	       , timelock
	       , op(Bitcoin::OP_CHECKLOCKTIMEVERIFY), op(Bitcoin::OP_DROP)
	       , push(sender)
	       , op(Bitcoin::OP_ENDIF)
	       , op(Bitcoin::OP_CHECKSIG)
	       };
}
std::vector<Bitcoin::ScriptInstruction>
submarine_script(Bitcoin::ScriptInstruction timelock) {
	return { op(Bitcoin::OP_HASH160), push(hashlock), op(Bitcoin::OP_EQUAL)
	       , op(Bitcoin::OP_IF)
	       , push(receiver)
	       , op(Bitcoin::OP_ELSE)
	       , timelock
	       , op(Bitcoin::OP_CHECKLOCKTIMEVERIFY), op(Bitcoin::OP_DROP)
	       , push(sender)
	       , op(Bitcoin::OP_ENDIF)
	       , op(Bitcoin::OP_CHECKSIG)
	       };
}

bool starts_with(std::string const& s, std::string const& prefix) {
	return s.compare(0, prefix.size(), prefix) == 0;
}

}

int main() {
	/* A hashlock of zeroes is present, not missing.  */
	{
		auto ins = submarine_script(push({0x71, 0x59, 0x12}));
		ins[1] = push(std::vector<std::uint8_t>(20, 0));
		auto fold = ScriptFold(Swap::Submarine);
		fold.feed(ins[0]);
		assert(!fold.has_hashlock());
		fold.feed(ins[1]);
		assert(fold.has_hashlock());
		feed_all(fold, std::vector<Bitcoin::ScriptInstruction>(ins.begin() + 2, ins.end()));
		auto f = fold.finish();
		assert(f.hashlock.to_vector() == std::vector<std::uint8_t>(20, 0));
	}

	/* Both shapes, fed one instruction at a time.  */
	{
		auto fold = ScriptFold(Swap::ReverseSubmarine);
		auto ins = reverse_script(push({0x71, 0x59, 0x12}));
		for (auto i = std::size_t(0); i < 8; ++i)
			fold.feed(ins[i]);
		assert(fold.has_hashlock());
		assert(fold.has_receiver());
		assert(!fold.has_timelock());
		assert(!fold.has_sender());
		for (auto i = std::size_t(8); i < ins.size(); ++i)
			fold.feed(ins[i]);
		assert(fold.has_hashlock());
		assert(fold.has_receiver());
		assert(fold.has_timelock());
		assert(fold.has_sender());
		auto f = fold.finish();
		assert(f.hashlock == Ripemd160::Hash("2bdd03d431251598f46a625f1d3abfcd7f491535"));
		assert(f.receiver.to_vector() == receiver);
		assert(f.sender.to_vector() == sender);
		assert(f.timelock == 1202545);
	}
	{
		auto fold = ScriptFold(Swap::Submarine);
		feed_all(fold, submarine_script(push({0x71, 0x59, 0x12})));
		auto f = fold.finish();
		assert(f.receiver.to_vector() == receiver);
		assert(f.sender.to_vector() == sender);
		assert(f.timelock == 1202545);
	}

	/* Small-integer timelocks.  */
	{
		auto fold = ScriptFold(Swap::ReverseSubmarine);
		feed_all(fold, reverse_script(op(Bitcoin::OP_16)));
		assert(fold.finish().timelock == 16);

		auto fold2 = ScriptFold(Swap::Submarine);
		feed_all(fold2, submarine_script(push({})));
		assert(fold2.finish().timelock == 0);
	}

	/* Largest timelock, in five bytes.  */
	{
		auto fold = ScriptFold(Swap::ReverseSubmarine);
		feed_all(fold, reverse_script(push({0xff, 0xff, 0xff, 0xff, 0x00})));
		assert(fold.finish().timelock == 0xFFFFFFFF);
	}

	/* Pushes before the first opcode are ignored.  */
	{
		auto ins = reverse_script(push({0x01, 0x02}));
		ins.insert(ins.begin(), push(sender));
		auto fold = ScriptFold(Swap::ReverseSubmarine);
		feed_all(fold, ins);
		assert(fold.finish().timelock == 0x0201);
	}

	/* Missing fields are all named.  */
	{
		auto fold = ScriptFold(Swap::ReverseSubmarine);
		fold.feed(op(Bitcoin::OP_HASH160));
		fold.feed(push(hashlock));
		auto msg = std::string();
		try {
			fold.finish();
		} catch (Swap::InputError const& e) {
			msg = e.what();
		}
		assert(starts_with(msg, "Swap script: could not find receiver key, timelock, sender key"));

		assert(starts_with( input_error(Swap::Submarine, {})
				  , "Swap script: could not find hashlock, receiver key, timelock, sender key"
				  ));
	}

	/* Sender without timelock.  */
	{
		auto ins = reverse_script(push({0x71, 0x59, 0x12}));
		/* Drop the timelock push and its CLTV DROP.  */
		ins.erase(ins.begin() + 10, ins.begin() + 13);
		assert(starts_with( input_error(Swap::ReverseSubmarine, ins)
				  , "Swap script: could not find timelock"
				  ));
	}

	/* Malformed fields.  */
	{
		auto ins = reverse_script(push({0x71, 0x59, 0x12}));
		ins[5] = push(std::vector<std::uint8_t>(19, 0xab));
		assert(starts_with( input_error(Swap::ReverseSubmarine, ins)
				  , "Swap script: hashlock push is 19 bytes"
				  ));

		ins = reverse_script(push({0x71, 0x59, 0x12}));
		ins[7] = push(std::vector<std::uint8_t>(33, 0x07));
		assert(starts_with( input_error(Swap::ReverseSubmarine, ins)
				  , "Swap script: invalid public key"
				  ));

		assert(starts_with( input_error(Swap::ReverseSubmarine, reverse_script(push({0x10, 0x80})))
				  , "Swap script: negative timelock"
				  ));
		assert(starts_with( input_error(Swap::Submarine, submarine_script(op(Bitcoin::OP_1NEGATE)))
				  , "Swap script: negative timelock"
				  ));
		assert(starts_with( input_error(Swap::Submarine, submarine_script(push({0, 0, 0, 0, 0, 0})))
				  , "Swap script: timelock push too long"
				  ));
		assert(starts_with( input_error(Swap::Submarine, submarine_script(push({0, 0, 0, 0, 0x01})))
				  , "Swap script: timelock exceeds 32 bits"
				  ));
	}

	/* A key-sized push after the reverse DROP is the
	 * sender, not a timelock.  */
	{
		auto ins = reverse_script(push(sender));
		auto msg = input_error(Swap::ReverseSubmarine, ins);
		assert(starts_with(msg, "Swap script: could not find timelock"));
	}

	return 0;
}
