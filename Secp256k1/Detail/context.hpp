#ifndef SECP256K1_DETAIL_CONTEXT_HPP
#define SECP256K1_DETAIL_CONTEXT_HPP

#include<memory>

extern "C" {
struct secp256k1_context_struct;
}

namespace Secp256k1 { namespace Detail {

/* The one randomized libsecp256k1-zkp context shared by
 * keys, signatures, ECDH and the confidential-transaction
 * modules.
 * The struct is opaque; the shared_ptr carries its
 * destroyer without naming it here.
 * Library callbacks on bad arguments throw
 * std::invalid_argument.
 */
extern std::shared_ptr<secp256k1_context_struct> const context;

}}

#endif /* SECP256K1_DETAIL_CONTEXT_HPP */
