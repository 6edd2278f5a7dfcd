#ifndef SHA256_HASHERSTREAM_HPP
#define SHA256_HASHERSTREAM_HPP

#include<iostream>
#include<memory>

namespace Sha256 { class Hash; }

namespace Sha256 {

/** class Sha256::HasherStream
 *
 * @brief an `std::ostream` where the data
 * written is put into a SHA256 hasher.
 *
 * @desc The consensus serializers write straight
 * into this stream, so a sighash or txid never
 * needs the whole serialization in memory.
 * Get the hash with `std::move(s).finalize()`.
 */
class HasherStream;

namespace Detail {

class HasherStreamBuf : public std::basic_streambuf<char> {
private:
	using Base = std::basic_streambuf<char>;
	using char_type = typename Base::char_type;
	using int_type = typename Base::int_type;

	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	HasherStreamBuf(HasherStreamBuf const&) =delete;
	HasherStreamBuf();
	HasherStreamBuf(HasherStreamBuf&&);
	~HasherStreamBuf();

	int_type overflow(int_type) override;

	Hash finalize()&&;
};

/* Base class ensures buffer is constructed before ostream is.  */
class HasherStreamBase {
protected:
	std::unique_ptr<HasherStreamBuf> buf;
	HasherStreamBase();
	HasherStreamBase(HasherStreamBase&&) =default;
};

}

class HasherStream : private Detail::HasherStreamBase, public std::ostream {
public:
	HasherStream() : std::ostream(buf.get()) { }

	Hash finalize()&& {
		flush();
		return std::move(*buf).finalize();
	}
	/* SHA256 of the SHA256 of everything written.  */
	Hash finalize_double()&&;
};

}

#endif /* !defined(SHA256_HASHERSTREAM_HPP) */
