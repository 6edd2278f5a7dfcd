#ifndef SHA256_FUN_HPP
#define SHA256_FUN_HPP

#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include<cstdint>
#include<vector>

namespace Sha256 {

inline
Sha256::Hash fun(void const* p, std::size_t len) {
	auto hasher = Sha256::Hasher();
	hasher.feed(p, len);
	return std::move(hasher).finalize();
}
inline
Sha256::Hash fun(std::vector<std::uint8_t> const& v) {
	return fun(v.data(), v.size());
}
/* Convenience version for double-sha256.  */
inline
Sha256::Hash fun(Sha256::Hash h) {
	std::uint8_t buf[32];
	h.to_buffer(buf);
	auto hasher = Sha256::Hasher();
	hasher.feed(buf, sizeof(buf));
	return std::move(hasher).finalize();
}
inline
Sha256::Hash double_fun(void const* p, std::size_t len) {
	return fun(fun(p, len));
}

}

#endif /* !defined(SHA256_FUN_HPP) */
