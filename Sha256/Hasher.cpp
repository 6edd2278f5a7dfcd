#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include<crypto/sha256.h>
#include<sodium/utils.h>

namespace Sha256 {

class Hasher::Impl {
public:
	CSHA256 s;

	~Impl() {
		sodium_memzero(&s, sizeof(s));
	}
};

Hasher::Hasher() : pimpl(std::make_unique<Impl>()) { }
Hasher::Hasher(Hasher&&) =default;
Hasher& Hasher::operator=(Hasher&&) =default;
Hasher::~Hasher() =default;

void Hasher::feed(void const* p, std::size_t len) {
	if (len == 0)
		return;
	pimpl->s.Write((unsigned char const*) p, len);
}

Sha256::Hash Hasher::finalize()&& {
	std::uint8_t buff[32];
	pimpl->s.Finalize((unsigned char*) buff);
	pimpl = nullptr;

	auto tmp = Sha256::Hash(buff);
	sodium_memzero(buff, sizeof(buff));
	return tmp;
}

}
