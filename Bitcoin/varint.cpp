#include"Bitcoin/varint.hpp"

namespace Bitcoin {

Detail::VarIntIn varint(std::uint64_t& v) {
	return Detail::VarIntIn(v);
}
Detail::VarIntOut varint(std::uint64_t const& v) {
	return Detail::VarIntOut(v);
}

}

std::ostream& operator<<(std::ostream& os, Bitcoin::Detail::VarIntOut o) {
	auto width = std::size_t(0);
	if (o.v < 0xFD) {
		os << char(o.v);
		return os;
	} else if (o.v <= 0xFFFF) {
		os << char(0xFD);
		width = 2;
	} else if (o.v <= 0xFFFFFFFF) {
		os << char(0xFE);
		width = 4;
	} else {
		os << char(0xFF);
		width = 8;
	}
	for (auto i = std::size_t(0); i < width; ++i)
		os << char((o.v >> (8 * i)) & 0xFF);
	return os;
}

std::istream& operator>>(std::istream& is, Bitcoin::Detail::VarIntIn o) {
	/* Use get() rather than >> so that bytes which
	 * happen to be whitespace are not skipped.
	 */
	auto t = is.get();
	if (t == std::char_traits<char>::eof()) {
		o.v = 0;
		return is;
	}

	auto width = std::size_t(0);
	switch (std::uint8_t(t)) {
	case 0xFD: width = 2; break;
	case 0xFE: width = 4; break;
	case 0xFF: width = 8; break;
	default:
		o.v = std::uint64_t(std::uint8_t(t));
		return is;
	}

	auto v = std::uint64_t(0);
	for (auto i = std::size_t(0); i < width; ++i) {
		auto c = is.get();
		if (c == std::char_traits<char>::eof()) {
			o.v = 0;
			return is;
		}
		v |= std::uint64_t(std::uint8_t(c)) << (8 * i);
	}
	o.v = v;

	return is;
}
