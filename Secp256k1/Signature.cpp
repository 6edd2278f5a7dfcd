#include<secp256k1.h>
#include<string.h>
#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/Signature.hpp"
#include"Sha256/Hash.hpp"
#include"Util/Str.hpp"

using Secp256k1::Detail::context;

namespace {

auto constexpr max_low_r_attempts = std::uint32_t(1024);

}

namespace Secp256k1 {

Signature::Signature(std::uint8_t const buffer[64]) {
	auto res = secp256k1_ecdsa_signature_parse_compact
		( context.get()
		, reinterpret_cast<secp256k1_ecdsa_signature*>(data)
		, reinterpret_cast<const unsigned char*>(buffer)
		);
	if (res == 0)
		throw BadSignatureEncoding();
	secp256k1_ecdsa_signature_normalize
		( context.get()
		, reinterpret_cast<secp256k1_ecdsa_signature*>(data)
		, reinterpret_cast<secp256k1_ecdsa_signature*>(data)
		);
}
Signature::Signature( Secp256k1::PrivKey const& sk
		    , Sha256::Hash const& m
		    ) {
	std::uint8_t mbuf[32];
	m.to_buffer(mbuf);
	unsigned char extra_entropy[32] = { 0 };

	for (auto counter = std::uint32_t(0); ; ++counter) {
		if (counter >= max_low_r_attempts)
			throw Util::BacktraceException<std::runtime_error>("Could not grind a low-R signature.");
		extra_entropy[0] = (counter >> 0) & 0xFF;
		extra_entropy[1] = (counter >> 8) & 0xFF;
		extra_entropy[2] = (counter >> 16) & 0xFF;
		extra_entropy[3] = (counter >> 24) & 0xFF;
		auto res = secp256k1_ecdsa_sign
			( context.get()
			, reinterpret_cast<secp256k1_ecdsa_signature*>(data)
			, reinterpret_cast<const unsigned char*>(mbuf)
			, reinterpret_cast<const unsigned char*>(sk.key)
			, nullptr
			, counter == 0 ? nullptr : extra_entropy
			);
		if (res == 0)
			throw Util::BacktraceException<std::runtime_error>("Nonce generation for signing failed.");
		if (has_low_r())
			break;
	}
}

bool Signature::has_low_r() const {
	/* Below was cribbed form lightningd.  */
	unsigned char compact_sig[64];
	secp256k1_ecdsa_signature_serialize_compact
		( context.get()
		, compact_sig
		, reinterpret_cast<secp256k1_ecdsa_signature const*>(data)
		);
	return compact_sig[0] < 0x80;
}

Signature::Signature() {
	memset(data, 0, sizeof(data));
}

Signature::Signature(std::string const& s) {
	auto buf = Util::Str::hexread(s);
	if (buf.size() != 64)
		throw BadSignatureEncoding();
	*this = Signature(&buf[0]);
}

void Signature::to_buffer(std::uint8_t buffer[64]) const {
	secp256k1_ecdsa_signature_serialize_compact
		( context.get()
		, reinterpret_cast<unsigned char*>(buffer)
		, reinterpret_cast<const secp256k1_ecdsa_signature*>(data)
		);
}

bool Signature::valid( Secp256k1::PubKey const& pk
		     , Sha256::Hash const& m
		     ) const {
	std::uint8_t mbuf[32];
	m.to_buffer(mbuf);

	auto res = secp256k1_ecdsa_verify
		( context.get()
		, reinterpret_cast<const secp256k1_ecdsa_signature*>(data)
		, reinterpret_cast<const unsigned char*>(mbuf)
		, reinterpret_cast<const secp256k1_pubkey*>(pk.get_key())
		);
	return res != 0;
}

std::vector<std::uint8_t>
Signature::der_encode() const {
	/* 72 bytes is the maximum DER length.  */
	unsigned char buf[72];
	auto len = sizeof(buf);
	auto res = secp256k1_ecdsa_signature_serialize_der
		( context.get()
		, buf
		, &len
		, reinterpret_cast<const secp256k1_ecdsa_signature*>(data)
		);
	if (res == 0)
		throw Util::BacktraceException<std::logic_error>("DER buffer too small.");
	return std::vector<std::uint8_t>(buf, buf + len);
}

Signature
Signature::der_decode(std::vector<std::uint8_t> const& d) {
	if (d.empty())
		throw BadSignatureEncoding();
	auto rv = Signature();
	auto res = secp256k1_ecdsa_signature_parse_der
		( context.get()
		, reinterpret_cast<secp256k1_ecdsa_signature*>(rv.data)
		, reinterpret_cast<unsigned char const*>(&d[0])
		, d.size()
		);
	if (res == 0)
		throw BadSignatureEncoding();
	secp256k1_ecdsa_signature_normalize
		( context.get()
		, reinterpret_cast<secp256k1_ecdsa_signature*>(rv.data)
		, reinterpret_cast<secp256k1_ecdsa_signature*>(rv.data)
		);
	return rv;
}

}
