#ifndef SWAP_ERROR_HPP
#define SWAP_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Swap {

/** enum Swap::ErrorKind
 *
 * @brief the closed set of ways a swap operation
 * can fail.
 *
 * @desc `Input` covers anything the caller handed
 * in that does not parse.
 * `Transaction` covers a swap that cannot move
 * forward with what is on chain.
 * `Network` covers the chain-query server.
 */
enum ErrorKind
{ Input
, Transaction
, Network
};

std::string error_kind_name(ErrorKind);

/** class Swap::Error
 *
 * @brief base of every exception the `Swap`
 * layer throws.
 *
 * @desc `what()` is the message as given, with no
 * prefix, so that a server's rejection reason is
 * passed to the caller unchanged.
 */
class Error : public Util::BacktraceException<std::runtime_error> {
private:
	ErrorKind k;

public:
	Error(ErrorKind k_, std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg)
		, k(k_)
		{ }

	ErrorKind kind() const { return k; }
};

class InputError : public Error {
public:
	InputError(std::string const& msg) : Error(Input, msg) { }
};
class TransactionError : public Error {
public:
	TransactionError(std::string const& msg) : Error(Transaction, msg) { }
};
class NetworkError : public Error {
public:
	NetworkError(std::string const& msg) : Error(Network, msg) { }
};

}

#endif /* !defined(SWAP_ERROR_HPP) */
