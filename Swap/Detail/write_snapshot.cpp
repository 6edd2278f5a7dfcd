#include"Elements/Tx.hpp"
#include"Swap/Detail/write_snapshot.hpp"
#include"Util/Str.hpp"
#include<fstream>

namespace {

std::string confidential(Elements::ConfidentialAsset const& a) {
	if (a.is_null())
		return "null";
	if (a.is_explicit())
		return std::string(a.get_asset());
	return "blinded " + Util::Str::hexdump(a.get_bytes());
}
std::string confidential(Elements::ConfidentialValue const& v) {
	if (v.is_null())
		return "null";
	if (v.is_explicit())
		return std::to_string(v.get_amount());
	return "blinded " + Util::Str::hexdump(v.get_bytes());
}

}

namespace Swap { namespace Detail {

void describe_tx(std::ostream& os, Elements::Tx const& tx) {
	os << "txid: " << std::string(tx.get_txid()) << "\n"
	   << "version: " << tx.nVersion << "\n"
	   << "locktime: " << tx.nLockTime << "\n"
	   << "vsize: " << tx.vsize() << "\n"
	    ;
	for (auto i = std::size_t(0); i < tx.inputs.size(); ++i) {
		auto const& in = tx.inputs[i];
		os << "input " << i << ":\n"
		   << "    prevout: " << std::string(in.prevTxid)
		   << ":" << in.prevOut << "\n"
		   << "    sequence: " << in.nSequence << "\n"
		   << "    scriptSig: " << Util::Str::hexdump(in.scriptSig)
		   << "\n"
		    ;
		for (auto const& item : in.witness.scriptWitness)
			os << "    witness: " << Util::Str::hexdump(item)
			   << "\n";
	}
	for (auto i = std::size_t(0); i < tx.outputs.size(); ++i) {
		auto const& out = tx.outputs[i];
		os << "output " << i << (out.is_fee() ? " (fee)" : "") << ":\n"
		   << "    asset: " << confidential(out.asset) << "\n"
		   << "    value: " << confidential(out.value) << "\n"
		   << "    nonce: " << Util::Str::hexdump(out.nonce.get_bytes())
		   << "\n"
		   << "    scriptPubKey: "
		   << Util::Str::hexdump(out.scriptPubKey) << "\n"
		   << "    surjection proof: "
		   << out.witness.surjectionProof.size() << " bytes\n"
		   << "    range proof: "
		   << out.witness.rangeProof.size() << " bytes\n"
		    ;
	}
}

bool write_snapshot(std::string const& path, Elements::Tx const& tx) {
	auto file = std::ofstream(path, std::ios::out | std::ios::trunc);
	if (!file)
		return false;
	file << std::string(tx) << "\n\n";
	describe_tx(file, tx);
	file.flush();
	return bool(file);
}

}}
