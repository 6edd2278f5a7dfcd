#include"Bitcoin/Script.hpp"

namespace Bitcoin {

ScriptInstruction ScriptReader::next() {
	auto ret = ScriptInstruction();
	if (at_end())
		throw MalformedScript("read past end");

	ret.opcode = script[pos++];
	ret.is_push = false;
	if (ret.opcode > OP_PUSHDATA4)
		return ret;

	ret.is_push = true;
	auto len = std::size_t(0);
	auto width = std::size_t(0);
	switch (ret.opcode) {
	case OP_PUSHDATA1: width = 1; break;
	case OP_PUSHDATA2: width = 2; break;
	case OP_PUSHDATA4: width = 4; break;
	default: len = ret.opcode; break;
	}
	if (width != 0) {
		if (script.size() - pos < width)
			throw MalformedScript("truncated push length");
		for (auto i = std::size_t(0); i < width; ++i)
			len |= std::size_t(script[pos + i]) << (8 * i);
		pos += width;
	}
	if (script.size() - pos < len)
		throw MalformedScript( "push of " + std::to_string(len)
				     + " bytes runs past end"
				     );
	ret.data.assign(script.begin() + pos, script.begin() + pos + len);
	pos += len;
	return ret;
}

bool small_int_opcode(std::int64_t& value, std::uint8_t opcode) {
	if (opcode == OP_1NEGATE) {
		value = -1;
		return true;
	}
	if (opcode >= OP_1 && opcode <= OP_16) {
		value = std::int64_t(opcode - OP_1 + 1);
		return true;
	}
	return false;
}

std::vector<std::uint8_t> script_num(std::int64_t n) {
	auto ret = std::vector<std::uint8_t>();
	if (n == 0)
		return ret;

	auto neg = n < 0;
	auto absvalue = neg ? std::uint64_t(-(n + 1)) + 1 : std::uint64_t(n);
	while (absvalue != 0) {
		ret.push_back(std::uint8_t(absvalue & 0xFF));
		absvalue >>= 8;
	}
	/* If the top bit is already taken, add a byte
	 * for the sign; else put the sign there.  */
	if (ret.back() & 0x80)
		ret.push_back(neg ? 0x80 : 0x00);
	else if (neg)
		ret.back() |= 0x80;
	return ret;
}

ScriptBuilder& ScriptBuilder::op(Opcode o) {
	script.push_back(std::uint8_t(o));
	return *this;
}
ScriptBuilder& ScriptBuilder::push(std::vector<std::uint8_t> const& data) {
	auto len = data.size();
	if (len < OP_PUSHDATA1) {
		script.push_back(std::uint8_t(len));
	} else if (len <= 0xFF) {
		script.push_back(OP_PUSHDATA1);
		script.push_back(std::uint8_t(len));
	} else if (len <= 0xFFFF) {
		script.push_back(OP_PUSHDATA2);
		script.push_back(std::uint8_t(len & 0xFF));
		script.push_back(std::uint8_t((len >> 8) & 0xFF));
	} else {
		script.push_back(OP_PUSHDATA4);
		for (auto i = 0; i < 32; i += 8)
			script.push_back(std::uint8_t((len >> i) & 0xFF));
	}
	script.insert(script.end(), data.begin(), data.end());
	return *this;
}
ScriptBuilder& ScriptBuilder::push_int(std::int64_t n) {
	if (n == -1 || (n >= 1 && n <= 16)) {
		script.push_back(std::uint8_t(n + (OP_1 - 1)));
		return *this;
	}
	if (n == 0) {
		script.push_back(OP_0);
		return *this;
	}
	return push(script_num(n));
}

}
