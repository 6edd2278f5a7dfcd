#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"
#include"Elements/Tx.hpp"
#include"Elements/TxId.hpp"
#include"Sha256/HasherStream.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<sstream>

namespace {

/* Larger counts cannot fit a block.  */
auto constexpr max_ios = std::uint64_t(100000);

void write_base(std::ostream& os, Elements::Tx const& v, bool segwit) {
	os << Bitcoin::le(v.nVersion);
	os.put(segwit ? 0x01 : 0x00);

	os << Bitcoin::varint(v.inputs.size());
	for (auto const& i : v.inputs)
		os << i;

	os << Bitcoin::varint(v.outputs.size());
	for (auto const& o : v.outputs)
		os << o;

	os << Bitcoin::le(v.nLockTime);
}

Elements::Tx parse(std::string str) {
	auto is = std::istringstream(std::move(str));
	auto ret = Elements::Tx();
	is >> ret;
	if (!is)
		throw Elements::TxParseError("invalid transaction encoding.");
	if (is.get() != std::char_traits<char>::eof())
		throw Elements::TxParseError("input too long.");
	return ret;
}

}

std::ostream& operator<<(std::ostream& os, Elements::Tx const& v) {
	auto segwit = v.has_witness();
	write_base(os, v, segwit);
	if (segwit) {
		for (auto const& i : v.inputs)
			os << i.witness;
		for (auto const& o : v.outputs)
			os << o.witness;
	}
	return os;
}

std::istream& operator>>(std::istream& is, Elements::Tx& v) {
	auto len = std::uint64_t();

	is >> Bitcoin::le(v.nVersion);
	auto flag = is.get();
	if (flag != 0x00 && flag != 0x01) {
		is.setstate(std::ios_base::failbit);
		return is;
	}
	auto segwit = (flag == 0x01);

	is >> Bitcoin::varint(len);
	if (!is || len > max_ios) {
		is.setstate(std::ios_base::failbit);
		return is;
	}
	v.inputs.resize(std::size_t(len));
	for (auto& i : v.inputs)
		is >> i;

	is >> Bitcoin::varint(len);
	if (!is || len > max_ios) {
		is.setstate(std::ios_base::failbit);
		return is;
	}
	v.outputs.resize(std::size_t(len));
	for (auto& o : v.outputs)
		is >> o;

	is >> Bitcoin::le(v.nLockTime);

	if (segwit) {
		for (auto& i : v.inputs)
			is >> i.witness;
		for (auto& o : v.outputs)
			is >> o.witness;
	} else {
		for (auto& i : v.inputs)
			i.witness = Elements::TxInWitness();
		for (auto& o : v.outputs)
			o.witness = Elements::TxOutWitness();
	}

	return is;
}

namespace Elements {

Tx::Tx(std::string const& s) {
	auto buf = std::vector<std::uint8_t>();
	try {
		buf = Util::Str::hexread(s);
	} catch (Util::Str::HexParseFailure const& e) {
		throw TxParseError(std::string("invalid hex string input: ") + e.what());
	}
	*this = parse(std::string(buf.begin(), buf.end()));
}
Tx Tx::from_bytes(std::vector<std::uint8_t> const& b) {
	return parse(std::string(b.begin(), b.end()));
}

bool Tx::has_witness() const {
	return std::any_of( inputs.begin(), inputs.end()
			  , [](TxIn const& i) { return !i.witness.empty(); }
			  )
	    || std::any_of( outputs.begin(), outputs.end()
			  , [](TxOut const& o) { return !o.witness.empty(); }
			  )
	     ;
}

Elements::TxId Tx::get_txid() const {
	Sha256::HasherStream hasher;
	write_base(hasher, *this, false);
	return Elements::TxId(std::move(hasher).finalize_double());
}

Tx::operator std::string() const {
	return Util::Str::hexdump(to_bytes());
}
std::vector<std::uint8_t> Tx::to_bytes() const {
	auto os = std::ostringstream();
	os << *this;
	auto str = os.str();
	return std::vector<std::uint8_t>(str.begin(), str.end());
}

std::size_t Tx::vsize() const {
	auto base = std::ostringstream();
	write_base(base, *this, false);
	auto base_size = base.str().size();
	auto total_size = to_bytes().size();
	auto weight = base_size * 3 + total_size;
	return (weight + 3) / 4;
}

}
