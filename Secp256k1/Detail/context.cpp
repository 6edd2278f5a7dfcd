#include<secp256k1.h>
#include<sodium/randombytes.h>
#include<sodium/utils.h>
#include<stdexcept>
#include<string>
#include"Secp256k1/Detail/context.hpp"
#include"Util/BacktraceException.hpp"

namespace {

/* Bad arguments from our side, e.g. an out-of-range scalar.  */
void illegal_callback(const char* msg, void*) {
	throw Util::BacktraceException<std::invalid_argument>(std::string("secp256k1-zkp: ") + msg);
}
/* Internal library failure, e.g. a scratch allocation.  */
void error_callback(const char* msg, void*) {
	throw Util::BacktraceException<std::runtime_error>(std::string("secp256k1-zkp: ") + msg);
}

secp256k1_context* make_context() {
	auto ctx = secp256k1_context_create(SECP256K1_CONTEXT_NONE);
	if (!ctx)
		throw Util::BacktraceException<std::runtime_error>("secp256k1-zkp: cannot create context");
	secp256k1_context_set_illegal_callback(ctx, &illegal_callback, nullptr);
	secp256k1_context_set_error_callback(ctx, &error_callback, nullptr);

	/* Blind the signing and commitment multiplications.  */
	unsigned char seed[32];
	randombytes_buf(seed, sizeof(seed));
	auto ok = secp256k1_context_randomize(ctx, seed);
	sodium_memzero(seed, sizeof(seed));
	if (!ok) {
		secp256k1_context_destroy(ctx);
		throw Util::BacktraceException<std::runtime_error>("secp256k1-zkp: cannot randomize context");
	}
	return ctx;
}

}

namespace Secp256k1 { namespace Detail {

std::shared_ptr<secp256k1_context_struct> const context
	( make_context()
	, &secp256k1_context_destroy
	);

}}
