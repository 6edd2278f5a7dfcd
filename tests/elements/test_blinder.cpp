#undef NDEBUG
#include"Bitcoin/script_to_scriptPubKey.hpp"
#include"Elements/Blinder.hpp"
#include"Elements/Network.hpp"
#include"Elements/TxOut.hpp"
#include"Secp256k1/KeyPair.hpp"
#include"Secp256k1/Random.hpp"
#include<assert.h>
#include<vector>

namespace {

/* Blind `value` of the policy asset to `receiver`,
 * spending one explicit output of `in_value`, with
 * the rest going to an explicit fee.  */
std::vector<Elements::TxOut>
blind_pair( std::uint64_t in_value
	  , std::uint64_t value
	  , Secp256k1::PubKey const& receiver
	  , Secp256k1::Random& rand
	  ) {
	auto asset = Elements::policy_asset(Elements::LiquidTestnet);
	auto in = Elements::TxOutSecrets();
	in.asset = asset;
	in.value = in_value;

	auto outs = std::vector<Elements::TxOut>(2);
	auto& out = outs[0];
	out.scriptPubKey = Bitcoin::p2wsh_scriptPubKey({0x51});

	auto abf = Elements::BlindingFactor::random(rand);
	out.asset = Elements::Blinder::blind_asset( asset, abf, {in}
						  , out.witness.surjectionProof
						  , rand
						  );
	auto zero = Elements::BlindingFactor();
	auto vbf = Elements::Blinder::final_vbf( {in_value, in_value - value, value}
					       , {zero, zero, abf}
					       , {zero, zero, zero}
					       , 1
					       );
	out.value = Elements::Blinder::blind_value( value, asset, abf, vbf
						  , out.scriptPubKey
						  , receiver
						  , out.nonce
						  , out.witness.rangeProof
						  , rand
						  );

	outs[1].asset = Elements::ConfidentialAsset::from_asset(asset);
	outs[1].value = Elements::ConfidentialValue::from_amount(in_value - value);
	return outs;
}

Elements::TxOut explicit_out(std::uint64_t value) {
	auto o = Elements::TxOut();
	o.asset = Elements::ConfidentialAsset::from_asset(
		Elements::policy_asset(Elements::LiquidTestnet)
	);
	o.value = Elements::ConfidentialValue::from_amount(value);
	o.scriptPubKey = {0x51};
	return o;
}

}

int main() {
	std::uint8_t seed[32] = {1, 2, 3};
	auto rand = Secp256k1::Random(seed);
	auto receiver = Secp256k1::KeyPair(rand);
	auto other = Secp256k1::KeyPair(rand);
	auto asset = Elements::policy_asset(Elements::LiquidTestnet);

	auto outs = blind_pair(100000, 99000, receiver.pub(), rand);
	auto const& out = outs[0];
	assert(out.asset.is_commitment());
	assert(out.value.is_commitment());
	assert(out.nonce.is_commitment());
	assert(!out.is_fee());
	assert(outs[1].is_fee());

	/* Proofs check out.  */
	assert(Elements::Blinder::verify_rangeproof(out));
	assert(Elements::Blinder::verify_surjection(
		out, {Elements::ConfidentialAsset::from_asset(asset)}
	));
	assert(Elements::Blinder::verify_balance({explicit_out(100000)}, outs));
	assert(!Elements::Blinder::verify_balance({explicit_out(100001)}, outs));
	assert(!Elements::Blinder::verify_rangeproof(outs[1]));

	/* Surjection onto a different asset fails.  */
	assert(!Elements::Blinder::verify_surjection(
		out, { Elements::ConfidentialAsset::from_asset(
			Elements::policy_asset(Elements::Liquid)
		) }
	));

	/* The receiver can open it.  */
	{
		auto s = Elements::Blinder::unblind(receiver.priv(), out);
		assert(s.asset == asset);
		assert(s.value == 99000);
		assert(!s.abf.is_zero());
		assert(!s.vbf.is_zero());
	}

	/* Nobody else can.  */
	{
		auto flag = false;
		try {
			Elements::Blinder::unblind(other.priv(), out);
		} catch (Elements::BlindingFailed const&) {
			flag = true;
		}
		assert(flag);
	}

	/* Explicit outputs unblind trivially.  */
	{
		auto s = Elements::Blinder::unblind(other.priv(), outs[1]);
		assert(s.asset == asset);
		assert(s.value == 1000);
		assert(s.abf.is_zero());
		assert(s.vbf.is_zero());
	}

	/* Tampering with the committed script breaks the proof.  */
	{
		auto bad = out;
		bad.scriptPubKey[2] ^= 0x01;
		assert(!Elements::Blinder::verify_rangeproof(bad));
		auto flag = false;
		try {
			Elements::Blinder::unblind(receiver.priv(), bad);
		} catch (Elements::BlindingFailed const&) {
			flag = true;
		}
		assert(flag);
	}

	/* Same seed, same output.  */
	{
		auto r1 = Secp256k1::Random(seed);
		auto r2 = Secp256k1::Random(seed);
		auto a = blind_pair(5000, 4000, receiver.pub(), r1);
		auto b = blind_pair(5000, 4000, receiver.pub(), r2);
		assert(a == b);
	}

	/* Surjecting needs a matching input.  */
	{
		auto in = Elements::TxOutSecrets();
		in.asset = Elements::policy_asset(Elements::Liquid);
		in.value = 1;
		auto proof = std::vector<std::uint8_t>();
		auto flag = false;
		try {
			Elements::Blinder::blind_asset( asset
						      , Elements::BlindingFactor::random(rand)
						      , {in}, proof, rand
						      );
		} catch (Elements::BlindingFailed const&) {
			flag = true;
		}
		assert(flag);
	}

	return 0;
}
