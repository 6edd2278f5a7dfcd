#include"Bitcoin/le.hpp"

namespace {

template<std::size_t N>
std::uint64_t read_le(std::istream& is) {
	auto v = std::uint64_t(0);
	for (auto i = std::size_t(0); i < N; ++i) {
		auto c = is.get();
		if (c == std::char_traits<char>::eof())
			return 0;
		v |= std::uint64_t(std::uint8_t(c)) << (8 * i);
	}
	return v;
}

}

std::ostream& operator<<(std::ostream& os, Bitcoin::Detail::Le32Const o) {
	os << char((o.v >> 0) & 0xFF)
	   << char((o.v >> 8) & 0xFF)
	   << char((o.v >> 16) & 0xFF)
	   << char((o.v >> 24) & 0xFF)
	   ;
	return os;
}
std::istream& operator>>(std::istream& is, Bitcoin::Detail::Le32 o) {
	o.v = std::uint32_t(read_le<4>(is));
	return is;
}
std::ostream& operator<<(std::ostream& os, Bitcoin::Detail::Le64Const o) {
	for (auto i = 0; i < 64; i += 8)
		os << char((o.v >> i) & 0xFF);
	return os;
}
std::istream& operator>>(std::istream& is, Bitcoin::Detail::Le64 o) {
	o.v = read_le<8>(is);
	return is;
}
std::ostream& operator<<(std::ostream& os, Bitcoin::Detail::Be64Const o) {
	for (auto i = 56; i >= 0; i -= 8)
		os << char((o.v >> i) & 0xFF);
	return os;
}
std::istream& operator>>(std::istream& is, Bitcoin::Detail::Be64 o) {
	auto v = std::uint64_t(0);
	for (auto i = 0; i < 8; ++i) {
		auto c = is.get();
		if (c == std::char_traits<char>::eof()) {
			v = 0;
			break;
		}
		v = (v << 8) | std::uint64_t(std::uint8_t(c));
	}
	o.v = v;
	return is;
}

namespace Bitcoin {

Detail::Le32 le(std::uint32_t& v) {
	return Detail::Le32(v);
}
Detail::Le32Const le(std::uint32_t const& v) {
	return Detail::Le32Const(v);
}
Detail::Le32 le(std::int32_t& v) {
	return Detail::Le32(reinterpret_cast<std::uint32_t&>(v));
}
Detail::Le32Const le(std::int32_t const& v) {
	return Detail::Le32Const(reinterpret_cast<std::uint32_t const&>(v));
}
Detail::Le64 le(std::uint64_t& v) {
	return Detail::Le64(v);
}
Detail::Le64Const le(std::uint64_t const& v) {
	return Detail::Le64Const(v);
}
Detail::Be64 be(std::uint64_t& v) {
	return Detail::Be64(v);
}
Detail::Be64Const be(std::uint64_t const& v) {
	return Detail::Be64Const(v);
}

}
