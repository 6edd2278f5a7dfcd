#ifndef SHA256_HASHER_HPP
#define SHA256_HASHER_HPP

#include<cstddef>
#include<memory>

namespace Sha256 { class Hash; }

namespace Sha256 {

/** class Sha256::Hasher
 *
 * @brief streaming SHA256: feed bytes, then
 * finalize once.
 *
 * @desc Move-only.  The midstate is wiped when
 * the hasher is finalized or destroyed.
 */
class Hasher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Hasher();
	Hasher(Hasher&&);
	Hasher& operator=(Hasher&&);
	~Hasher();

	void feed(void const* p, std::size_t size);

	Sha256::Hash finalize()&&;
};

}

#endif /* !defined(SHA256_HASHER_HPP) */
