#include"Bitcoin/Script.hpp"
#include"Elements/Blinder.hpp"
#include"Elements/TxOut.hpp"
#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<secp256k1.h>
#include<secp256k1_generator.h>
#include<secp256k1_rangeproof.h>
#include<secp256k1_surjectionproof.h>
#include<sodium/utils.h>
#include<string.h>

using Secp256k1::Detail::context;

namespace {

auto constexpr max_surjection_targets = std::size_t(3);
auto constexpr surjection_iterations = std::size_t(100);
auto constexpr ct_exponent = 0;
auto constexpr ct_bits = 52;
/* Large enough for any 64-bit range proof.  */
auto constexpr max_rangeproof_size = std::size_t(5134);
auto constexpr message_size = std::size_t(64);

/* OP_RETURN outputs, or scripts too long to ever run.  */
bool is_unspendable(std::vector<std::uint8_t> const& script) {
	return (!script.empty() && script[0] == Bitcoin::OP_RETURN)
	    || script.size() > 10000
	     ;
}

/* The generator an asset field commits to.  */
secp256k1_generator
generator_of(Elements::ConfidentialAsset const& asset) {
	auto gen = secp256k1_generator();
	if (asset.is_commitment()) {
		if (!secp256k1_generator_parse( context.get(), &gen
					      , &asset.get_bytes()[0]
					      ))
			throw Elements::BlindingFailed("bad asset commitment");
	} else if (asset.is_explicit()) {
		if (!secp256k1_generator_generate( context.get(), &gen
						 , &asset.get_bytes()[1]
						 ))
			throw Elements::BlindingFailed("bad explicit asset");
	} else
		throw Elements::BlindingFailed("null asset");
	return gen;
}
secp256k1_generator
blinded_generator( Elements::AssetId const& asset
		 , Elements::BlindingFactor const& abf
		 ) {
	std::uint8_t buf[32];
	asset.to_buffer(buf);
	auto gen = secp256k1_generator();
	if (!secp256k1_generator_generate_blinded( context.get(), &gen
						 , buf, abf.data
						 ))
		throw Elements::BlindingFailed("cannot blind asset");
	return gen;
}
std::vector<std::uint8_t>
serialize_generator(secp256k1_generator const& gen) {
	auto ret = std::vector<std::uint8_t>(33);
	secp256k1_generator_serialize(context.get(), &ret[0], &gen);
	return ret;
}

/* The commitment a value field stands for.
 * An explicit value commits with a zero blinding
 * factor.
 */
bool commitment_of( secp256k1_pedersen_commitment& commit
		  , Elements::TxOut const& out
		  ) {
	if (out.value.is_commitment())
		return secp256k1_pedersen_commitment_parse( context.get(), &commit
							  , &out.value.get_bytes()[0]
							  ) == 1;
	if (!out.value.is_explicit())
		return false;
	auto gen = generator_of(out.asset);
	std::uint8_t zero[32] = {0};
	return secp256k1_pedersen_commit( context.get(), &commit
					, zero, out.value.get_amount(), &gen
					) == 1;
}

Sha256::Hash
rangeproof_nonce( Secp256k1::PrivKey const& sk
		, Secp256k1::PubKey const& pk
		) {
	std::uint8_t shared[32];
	Secp256k1::ecdh(sk, pk).to_buffer(shared);
	auto ret = Sha256::fun(shared, sizeof(shared));
	sodium_memzero(shared, sizeof(shared));
	return ret;
}

}

namespace Elements {

BlindingFactor::BlindingFactor() {
	memset(data, 0, sizeof(data));
}
BlindingFactor BlindingFactor::random(Secp256k1::Random& rand) {
	auto ret = BlindingFactor();
	do {
		rand.get_bytes(ret.data, sizeof(ret.data));
	} while (!secp256k1_ec_seckey_verify(context.get(), ret.data));
	return ret;
}
BlindingFactor BlindingFactor::from_buffer(std::uint8_t const buf[32]) {
	auto ret = BlindingFactor();
	memcpy(ret.data, buf, sizeof(ret.data));
	return ret;
}
bool BlindingFactor::is_zero() const {
	return sodium_is_zero(data, sizeof(data)) == 1;
}
BlindingFactor::operator std::string() const {
	return Util::Str::hexdump(data, sizeof(data));
}
bool BlindingFactor::operator==(BlindingFactor const& o) const {
	return sodium_memcmp(data, o.data, sizeof(data)) == 0;
}

namespace Blinder {

TxOutSecrets unblind( Secp256k1::PrivKey const& blinding_key
		    , Elements::TxOut const& out
		    ) {
	auto ret = TxOutSecrets();

	if (out.asset.is_explicit() && out.value.is_explicit()) {
		ret.asset = out.asset.get_asset();
		ret.value = out.value.get_amount();
		return ret;
	}
	if (!out.value.is_commitment())
		throw BlindingFailed("value is not a commitment");
	if (!out.nonce.is_commitment())
		throw BlindingFailed("output has no nonce public key");
	if (out.witness.rangeProof.empty())
		throw BlindingFailed("output has no range proof");

	auto nonce = Sha256::Hash();
	try {
		nonce = rangeproof_nonce(blinding_key, out.nonce.get_pubkey());
	} catch (Secp256k1::InvalidPubKey const&) {
		throw BlindingFailed("nonce is not a valid public key");
	}
	std::uint8_t nonce_buf[32];
	nonce.to_buffer(nonce_buf);

	auto observed = generator_of(out.asset);
	auto commit = secp256k1_pedersen_commitment();
	if (!secp256k1_pedersen_commitment_parse( context.get(), &commit
						, &out.value.get_bytes()[0]
						))
		throw BlindingFailed("bad value commitment");

	std::uint8_t msg[message_size] = {0};
	auto msg_size = sizeof(msg);
	auto min_value = std::uint64_t();
	auto max_value = std::uint64_t();
	auto amount = std::uint64_t();
	auto const& spk = out.scriptPubKey;
	auto const& proof = out.witness.rangeProof;
	auto res = secp256k1_rangeproof_rewind
		( context.get()
		, ret.vbf.data
		, &amount
		, msg, &msg_size
		, nonce_buf
		, &min_value, &max_value
		, &commit
		, &proof[0], proof.size()
		, spk.empty() ? nullptr : &spk[0], spk.size()
		, &observed
		);
	if (!res)
		throw BlindingFailed("range proof does not rewind with this key");
	if (msg_size != message_size)
		throw BlindingFailed("range proof message has wrong size");

	auto asset = AssetId::from_buffer(msg);
	auto abf = BlindingFactor::from_buffer(msg + 32);
	auto derived = blinded_generator(asset, abf);
	if (serialize_generator(derived) != serialize_generator(observed))
		throw BlindingFailed("asset commitment mismatch");

	ret.asset = asset;
	ret.abf = abf;
	ret.value = amount;
	return ret;
}

ConfidentialAsset blind_asset( AssetId const& asset
			     , BlindingFactor const& abf
			     , std::vector<TxOutSecrets> const& inputs
			     , std::vector<std::uint8_t>& surjectionProof
			     , Secp256k1::Random& rand
			     ) {
	if (inputs.empty())
		throw BlindingFailed("no inputs to surject onto");
	if (inputs.size() > SECP256K1_SURJECTIONPROOF_MAX_N_INPUTS)
		throw BlindingFailed("too many inputs to surject onto");

	auto gen = blinded_generator(asset, abf);

	auto tags = std::vector<secp256k1_fixed_asset_tag>(inputs.size());
	auto gens = std::vector<secp256k1_generator>();
	for (auto i = std::size_t(0); i < inputs.size(); ++i) {
		inputs[i].asset.to_buffer(tags[i].data);
		gens.push_back(blinded_generator(inputs[i].asset, inputs[i].abf));
	}
	auto out_tag = secp256k1_fixed_asset_tag();
	asset.to_buffer(out_tag.data);

	std::uint8_t seed[32];
	rand.get_bytes(seed, sizeof(seed));

	auto proof = secp256k1_surjectionproof();
	auto input_index = std::size_t();
	auto res = secp256k1_surjectionproof_initialize
		( context.get()
		, &proof, &input_index
		, &tags[0], tags.size()
		, std::min(max_surjection_targets, tags.size())
		, &out_tag
		, surjection_iterations
		, seed
		);
	if (res == 0)
		throw BlindingFailed("asset is not among the inputs");
	res = secp256k1_surjectionproof_generate
		( context.get()
		, &proof
		, &gens[0], gens.size()
		, &gen
		, input_index
		, inputs[input_index].abf.data
		, abf.data
		);
	if (res == 0)
		throw BlindingFailed("cannot generate surjection proof");
	if (!secp256k1_surjectionproof_verify( context.get(), &proof
					     , &gens[0], gens.size()
					     , &gen
					     ))
		throw BlindingFailed("surjection proof does not verify");

	auto len = secp256k1_surjectionproof_serialized_size(context.get(), &proof);
	surjectionProof.resize(len);
	secp256k1_surjectionproof_serialize( context.get()
					   , &surjectionProof[0], &len
					   , &proof
					   );
	surjectionProof.resize(len);

	return ConfidentialAsset::from_generator(serialize_generator(gen));
}

BlindingFactor final_vbf( std::vector<std::uint64_t> const& values
			, std::vector<BlindingFactor> const& abfs
			, std::vector<BlindingFactor> const& vbfs
			, std::size_t n_inputs
			) {
	auto n_total = values.size();
	if (abfs.size() != n_total || vbfs.size() != n_total)
		throw BlindingFailed("mismatched blinding factor counts");
	if (n_inputs == 0 || n_inputs >= n_total)
		throw BlindingFailed("need at least one input and one output");

	auto work = vbfs;
	auto abf_ptrs = std::vector<unsigned char const*>();
	auto vbf_ptrs = std::vector<unsigned char*>();
	for (auto i = std::size_t(0); i < n_total; ++i) {
		abf_ptrs.push_back(abfs[i].data);
		vbf_ptrs.push_back(work[i].data);
	}
	auto res = secp256k1_pedersen_blind_generator_blind_sum
		( context.get()
		, &values[0]
		, &abf_ptrs[0]
		, &vbf_ptrs[0]
		, n_total
		, n_inputs
		);
	if (!res)
		throw BlindingFailed("cannot balance value blinding factors");
	return work.back();
}

ConfidentialValue blind_value( std::uint64_t value
			     , AssetId const& asset
			     , BlindingFactor const& abf
			     , BlindingFactor const& vbf
			     , std::vector<std::uint8_t> const& scriptPubKey
			     , Secp256k1::PubKey const& receiver
			     , ConfidentialNonce& nonce
			     , std::vector<std::uint8_t>& rangeProof
			     , Secp256k1::Random& rand
			     ) {
	auto gen = blinded_generator(asset, abf);

	auto commit = secp256k1_pedersen_commitment();
	if (!secp256k1_pedersen_commit( context.get(), &commit
				      , vbf.data, value, &gen
				      ))
		throw BlindingFailed("cannot commit to value");

	auto ephemeral = Secp256k1::PrivKey(rand);
	nonce = ConfidentialNonce::from_pubkey(Secp256k1::PubKey(ephemeral));
	std::uint8_t nonce_buf[32];
	rangeproof_nonce(ephemeral, receiver).to_buffer(nonce_buf);

	std::uint8_t msg[message_size];
	asset.to_buffer(msg);
	memcpy(msg + 32, abf.data, 32);

	/* A zero-value output cannot prove a minimum of 1.  */
	auto min_value = std::uint64_t(
		(is_unspendable(scriptPubKey) || value == 0) ? 0 : 1
	);

	rangeProof.resize(max_rangeproof_size);
	auto len = rangeProof.size();
	auto res = secp256k1_rangeproof_sign
		( context.get()
		, &rangeProof[0], &len
		, min_value
		, &commit
		, vbf.data
		, nonce_buf
		, ct_exponent, ct_bits
		, value
		, msg, sizeof(msg)
		, scriptPubKey.empty() ? nullptr : &scriptPubKey[0]
		, scriptPubKey.size()
		, &gen
		);
	sodium_memzero(nonce_buf, sizeof(nonce_buf));
	if (!res)
		throw BlindingFailed("cannot sign range proof");
	rangeProof.resize(len);

	auto ret = std::vector<std::uint8_t>(33);
	secp256k1_pedersen_commitment_serialize(context.get(), &ret[0], &commit);
	return ConfidentialValue::from_commitment(std::move(ret));
}

bool verify_surjection( Elements::TxOut const& out
		      , std::vector<ConfidentialAsset> const& inputs
		      ) {
	auto const& bytes = out.witness.surjectionProof;
	if (bytes.empty() || inputs.empty())
		return false;
	auto gens = std::vector<secp256k1_generator>();
	for (auto const& i : inputs)
		gens.push_back(generator_of(i));
	auto gen = generator_of(out.asset);

	auto proof = secp256k1_surjectionproof();
	if (!secp256k1_surjectionproof_parse( context.get(), &proof
					    , &bytes[0], bytes.size()
					    ))
		return false;
	return secp256k1_surjectionproof_verify( context.get(), &proof
					       , &gens[0], gens.size()
					       , &gen
					       ) == 1;
}

bool verify_rangeproof(Elements::TxOut const& out) {
	auto const& proof = out.witness.rangeProof;
	if (proof.empty() || !out.value.is_commitment())
		return false;
	auto commit = secp256k1_pedersen_commitment();
	if (!commitment_of(commit, out))
		return false;
	auto gen = generator_of(out.asset);
	auto min_value = std::uint64_t();
	auto max_value = std::uint64_t();
	auto const& spk = out.scriptPubKey;
	return secp256k1_rangeproof_verify
		( context.get()
		, &min_value, &max_value
		, &commit
		, &proof[0], proof.size()
		, spk.empty() ? nullptr : &spk[0], spk.size()
		, &gen
		) == 1;
}

bool verify_balance( std::vector<Elements::TxOut> const& spent
		   , std::vector<Elements::TxOut> const& outputs
		   ) {
	auto collect = []( std::vector<secp256k1_pedersen_commitment>& commits
			 , std::vector<Elements::TxOut> const& outs
			 ) {
		for (auto const& o : outs) {
			/* Explicit zero commits to the point at
			 * infinity, which adds nothing.  */
			if (o.value.is_explicit() && o.value.get_amount() == 0)
				continue;
			auto c = secp256k1_pedersen_commitment();
			if (!commitment_of(c, o))
				return false;
			commits.push_back(c);
		}
		return true;
	};
	auto in_commits = std::vector<secp256k1_pedersen_commitment>();
	auto out_commits = std::vector<secp256k1_pedersen_commitment>();
	if (!collect(in_commits, spent) || !collect(out_commits, outputs))
		return false;

	auto in_ptrs = std::vector<secp256k1_pedersen_commitment const*>();
	for (auto const& c : in_commits)
		in_ptrs.push_back(&c);
	auto out_ptrs = std::vector<secp256k1_pedersen_commitment const*>();
	for (auto const& c : out_commits)
		out_ptrs.push_back(&c);

	return secp256k1_pedersen_verify_tally
		( context.get()
		, in_ptrs.empty() ? nullptr : &in_ptrs[0], in_ptrs.size()
		, out_ptrs.empty() ? nullptr : &out_ptrs[0], out_ptrs.size()
		) == 1;
}

}

}
