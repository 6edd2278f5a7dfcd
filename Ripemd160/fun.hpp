#ifndef RIPEMD160_FUN_HPP
#define RIPEMD160_FUN_HPP

#include"Ripemd160/Hash.hpp"
#include<cstddef>
#include<cstdint>
#include<vector>

namespace Ripemd160 {

/** Ripemd160::fun
 *
 * @brief RIPEMD160 of the given bytes, in one go.
 *
 * @desc Only ever applied to a SHA256 result, as
 * the second half of `Bitcoin::hash160`, so there
 * is no streaming interface.
 */
Ripemd160::Hash fun(void const* p, std::size_t len);

inline
Ripemd160::Hash fun(std::vector<std::uint8_t> const& v) {
	return fun(v.data(), v.size());
}

}

#endif /* !defined(RIPEMD160_FUN_HPP) */
