#include"Bitcoin/Script.hpp"
#include"Elements/Address.hpp"
#include"Swap/Detail/ScriptFold.hpp"
#include"Swap/Error.hpp"
#include"Swap/Script.hpp"
#include"Util/Str.hpp"

namespace Swap {

Script::Script( Electrum::Config config_
	      , Direction direction_
	      , Ripemd160::Hash hashlock_
	      , Secp256k1::PubKey receiver_
	      , Secp256k1::PubKey sender_
	      , std::uint32_t timelock_
	      , Secp256k1::KeyPair blinding_
	      ) : config(std::move(config_))
		, direction(direction_)
		, hashlock(std::move(hashlock_))
		, receiver(std::move(receiver_))
		, sender(std::move(sender_))
		, timelock(timelock_)
		, blinding(std::move(blinding_))
		{ }

Script Script::decode( std::vector<std::uint8_t> const& redeem_script
		     , Direction direction
		     , Secp256k1::KeyPair blinding
		     , Electrum::Config config
		     ) {
	auto fold = Detail::ScriptFold(direction);
	auto reader = Bitcoin::ScriptReader(redeem_script);
	try {
		while (!reader.at_end())
			fold.feed(reader.next());
	} catch (Bitcoin::MalformedScript const& e) {
		throw InputError(std::string("Swap script: ") + e.what());
	}
	auto fields = fold.finish();

	return Script( std::move(config)
		     , direction
		     , std::move(fields.hashlock)
		     , std::move(fields.receiver)
		     , std::move(fields.sender)
		     , fields.timelock
		     , std::move(blinding)
		     );
}

Script Script::from_hex( Direction direction
		       , std::string const& redeem_script_hex
		       , std::string const& blinding_privkey_hex
		       , Electrum::Config config
		       ) {
	auto redeem_script = std::vector<std::uint8_t>();
	try {
		redeem_script = Util::Str::hexread(redeem_script_hex);
	} catch (Util::Str::HexParseFailure const& e) {
		throw InputError(std::string("Redeem script: ") + e.what());
	}

	auto blinding = Secp256k1::KeyPair();
	try {
		blinding = Secp256k1::KeyPair::from_hex(blinding_privkey_hex);
	} catch (Util::Str::HexParseFailure const& e) {
		throw InputError(std::string("Blinding key: ") + e.what());
	} catch (Secp256k1::InvalidPrivKey const& e) {
		throw InputError(std::string("Blinding key: ") + e.what());
	}

	return decode( redeem_script
		     , direction
		     , std::move(blinding)
		     , std::move(config)
		     );
}

std::vector<std::uint8_t> Script::to_script() const {
	auto hash = hashlock.to_vector();

	auto b = Bitcoin::ScriptBuilder();
	switch (direction) {
	case Submarine:
		b.op(Bitcoin::OP_HASH160)
		 .push(hash)
		 .op(Bitcoin::OP_EQUAL)
		 .op(Bitcoin::OP_IF)
			.push(receiver.to_vector())
		 .op(Bitcoin::OP_ELSE)
			.push_int(timelock)
			.op(Bitcoin::OP_CHECKLOCKTIMEVERIFY)
			.op(Bitcoin::OP_DROP)
			.push(sender.to_vector())
		 .op(Bitcoin::OP_ENDIF)
		 .op(Bitcoin::OP_CHECKSIG)
		 ;
		break;
	case ReverseSubmarine:
		b.op(Bitcoin::OP_SIZE)
		 .push(std::vector<std::uint8_t>{0x20})
		 .op(Bitcoin::OP_EQUAL)
		 .op(Bitcoin::OP_IF)
			.op(Bitcoin::OP_HASH160)
			.push(hash)
			.op(Bitcoin::OP_EQUALVERIFY)
			.push(receiver.to_vector())
		 .op(Bitcoin::OP_ELSE)
			.op(Bitcoin::OP_DROP)
			.push_int(timelock)
			.op(Bitcoin::OP_CHECKLOCKTIMEVERIFY)
			.op(Bitcoin::OP_DROP)
			.push(sender.to_vector())
		 .op(Bitcoin::OP_ENDIF)
		 .op(Bitcoin::OP_CHECKSIG)
		 ;
		break;
	}
	return b.get();
}

Elements::Address Script::to_address() const {
	auto script = to_script();
	switch (direction) {
	case Submarine:
		return Elements::Address::p2sh_p2wsh( config.network
						    , script
						    , blinding.pub()
						    );
	case ReverseSubmarine:
		return Elements::Address::p2wsh( config.network
					       , script
					       , blinding.pub()
					       );
	}
	throw std::logic_error("Swap::Script::to_address: invalid Direction");
}

std::vector<std::uint8_t> Script::lockup_scriptPubKey() const {
	return to_address().scriptPubKey();
}

bool Script::operator==(Script const& o) const {
	return config.network == o.config.network
	    && direction == o.direction
	    && hashlock == o.hashlock
	    && receiver == o.receiver
	    && sender == o.sender
	    && timelock == o.timelock
	    && blinding.pub() == o.blinding.pub()
	     ;
}

}
