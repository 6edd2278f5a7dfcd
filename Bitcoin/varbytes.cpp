#include"Bitcoin/varbytes.hpp"
#include"Bitcoin/varint.hpp"

namespace {

/* Block weight limit; nothing inside a transaction
 * can be longer.
 */
auto const max_length = std::uint64_t(4000000);

}

namespace Bitcoin {

Detail::VarBytes varbytes(std::vector<std::uint8_t>& v) {
	return Detail::VarBytes(v);
}
Detail::VarBytesConst varbytes(std::vector<std::uint8_t> const& v) {
	return Detail::VarBytesConst(v);
}

}

std::ostream& operator<<(std::ostream& os, Bitcoin::Detail::VarBytesConst o) {
	os << Bitcoin::varint(o.v.size());
	if (!o.v.empty())
		os.write((char const*) &o.v[0], o.v.size());
	return os;
}
std::istream& operator>>(std::istream& is, Bitcoin::Detail::VarBytes o) {
	auto len = std::uint64_t();
	is >> Bitcoin::varint(len);
	if (!is || len > max_length) {
		is.setstate(std::ios_base::failbit);
		o.v.clear();
		return is;
	}
	o.v.resize(std::size_t(len));
	if (len != 0)
		is.read((char*) &o.v[0], std::streamsize(len));
	return is;
}
