#include"Ripemd160/fun.hpp"
#include<basicsecure.h>
#include<crypto/ripemd160.h>

namespace Ripemd160 {

Ripemd160::Hash fun(void const* p, std::size_t len) {
	unsigned char buf[20];
	{
		auto hasher = CRIPEMD160();
		hasher.Write((unsigned char const*) p, len);
		hasher.Finalize(buf);
		basicsecure_clear(&hasher, sizeof(hasher));
	}
	auto ret = Ripemd160::Hash();
	ret.from_buffer(buf);
	basicsecure_clear(buf, sizeof(buf));
	return ret;
}

}
