#include"Bitcoin/Script.hpp"
#include"Bitcoin/base58.hpp"
#include"Bitcoin/hash160.hpp"
#include"Bitcoin/script_to_scriptPubKey.hpp"
#include"Elements/Address.hpp"
#include"Ripemd160/Hash.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"
#include"Util/Blech32.hpp"
#include<algorithm>
#include<iterator>

namespace {

std::string lowercase(std::string s) {
	std::transform( s.begin(), s.end(), s.begin()
		      , [](char c) {
			if (c >= 'A' && c <= 'Z')
				return char(c - 'A' + 'a');
			return c;
		      }
		      );
	return s;
}

bool starts_with(std::string const& s, std::string const& prefix) {
	return s.size() >= prefix.size()
	    && s.compare(0, prefix.size(), prefix) == 0
	     ;
}

}

namespace Elements {

Address Address::p2wsh( Network net
		      , std::vector<std::uint8_t> const& witnessScript
		      , Secp256k1::PubKey const& blinder
		      ) {
	auto hash = Sha256::fun(witnessScript);
	auto program = std::vector<std::uint8_t>(32);
	hash.to_buffer(&program[0]);
	return Address(net, Segwit, blinder, 0, std::move(program));
}
Address Address::p2sh_p2wsh( Network net
			   , std::vector<std::uint8_t> const& witnessScript
			   , Secp256k1::PubKey const& blinder
			   ) {
	auto redeem = Bitcoin::p2wsh_scriptPubKey(witnessScript);
	auto hash = Bitcoin::hash160(redeem);
	auto program = std::vector<std::uint8_t>(20);
	hash.to_buffer(&program[0]);
	return Address(net, P2SH, blinder, 0, std::move(program));
}

Address Address::parse(std::string const& s, Network net) {
	auto const& p = params(net);
	auto lower = lowercase(s);

	if (starts_with(lower, std::string(p.bech32_hrp) + "1"))
		throw InvalidAddress("not a confidential address: " + s);

	if (starts_with(lower, std::string(p.blech32_hrp) + "1")) {
		auto variant = Util::Blech32::Variant();
		auto hrp = std::string();
		auto values = std::vector<std::uint8_t>();
		if (!Util::Blech32::decode(variant, hrp, values, s))
			throw InvalidAddress("bad blech32 encoding: " + s);
		if (hrp != p.blech32_hrp)
			throw InvalidAddress("wrong network: " + s);
		if (values.empty())
			throw InvalidAddress("empty data: " + s);
		auto witver = values[0];
		if (witver > 16)
			throw InvalidAddress("bad witness version: " + s);
		auto expected = witver == 0 ? Util::Blech32::BLECH32
					    : Util::Blech32::BLECH32M
					    ;
		if (variant != expected)
			throw InvalidAddress("wrong checksum variant: " + s);

		auto data = std::vector<std::uint8_t>();
		auto ok = Util::Blech32::convert_bits<5, 8, false>
			( std::back_inserter(data)
			, values.begin() + 1, values.end()
			);
		if (!ok)
			throw InvalidAddress("bad padding: " + s);
		if (data.size() < 33 + 2 || data.size() > 33 + 40)
			throw InvalidAddress("bad program length: " + s);
		auto program = std::vector<std::uint8_t>(data.begin() + 33, data.end());
		if (witver == 0 && program.size() != 20 && program.size() != 32)
			throw InvalidAddress("bad v0 program length: " + s);
		try {
			auto blinder = Secp256k1::PubKey::from_vector(
				std::vector<std::uint8_t>(data.begin(), data.begin() + 33)
			);
			return Address(net, Segwit, std::move(blinder), witver, std::move(program));
		} catch (Secp256k1::InvalidPubKey const&) {
			throw InvalidAddress("bad blinding key: " + s);
		}
	}

	auto payload = std::vector<std::uint8_t>();
	if (!Bitcoin::base58check_decode(payload, s))
		throw InvalidAddress("bad encoding: " + s);
	if (payload.size() == 21)
		throw InvalidAddress("not a confidential address: " + s);
	if (payload.size() != 2 + 33 + 20)
		throw InvalidAddress("bad length: " + s);
	if (payload[0] != p.blinded_prefix)
		throw InvalidAddress("wrong network: " + s);
	auto kind = Kind();
	if (payload[1] == p.p2sh_prefix)
		kind = P2SH;
	else if (payload[1] == p.p2pkh_prefix)
		kind = P2PKH;
	else
		throw InvalidAddress("wrong network: " + s);
	try {
		auto blinder = Secp256k1::PubKey::from_vector(
			std::vector<std::uint8_t>(payload.begin() + 2, payload.begin() + 35)
		);
		return Address( net, kind, std::move(blinder), 0
			      , std::vector<std::uint8_t>(payload.begin() + 35, payload.end())
			      );
	} catch (Secp256k1::InvalidPubKey const&) {
		throw InvalidAddress("bad blinding key: " + s);
	}
}

Address::operator std::string() const {
	auto const& p = params(net);
	auto key = blinder.to_vector();

	switch (kind) {
	case Segwit: {
		auto data = key;
		data.insert(data.end(), program.begin(), program.end());
		auto values = std::vector<std::uint8_t>{witver};
		Util::Blech32::convert_bits<8, 5, true>
			( std::back_inserter(values)
			, data.begin(), data.end()
			);
		auto variant = witver == 0 ? Util::Blech32::BLECH32
					   : Util::Blech32::BLECH32M
					   ;
		return Util::Blech32::encode(variant, p.blech32_hrp, values);
	}
	case P2SH:
	case P2PKH: {
		auto payload = std::vector<std::uint8_t>();
		payload.push_back(p.blinded_prefix);
		payload.push_back(kind == P2SH ? p.p2sh_prefix : p.p2pkh_prefix);
		payload.insert(payload.end(), key.begin(), key.end());
		payload.insert(payload.end(), program.begin(), program.end());
		return Bitcoin::base58check_encode(payload);
	}
	}
	throw InvalidAddress("unknown kind");
}

std::vector<std::uint8_t> Address::scriptPubKey() const {
	auto b = Bitcoin::ScriptBuilder();
	switch (kind) {
	case Segwit:
		if (witver == 0)
			b.op(Bitcoin::OP_0);
		else
			b.op(Bitcoin::Opcode(Bitcoin::OP_1 + witver - 1));
		b.push(program);
		break;
	case P2SH:
		b.op(Bitcoin::OP_HASH160)
		 .push(program)
		 .op(Bitcoin::OP_EQUAL)
		 ;
		break;
	case P2PKH:
		b.op(Bitcoin::OP_DUP)
		 .op(Bitcoin::OP_HASH160)
		 .push(program)
		 .op(Bitcoin::OP_EQUALVERIFY)
		 .op(Bitcoin::OP_CHECKSIG)
		 ;
		break;
	}
	return b.get();
}

}
