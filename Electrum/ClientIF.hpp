#ifndef ELECTRUM_CLIENTIF_HPP
#define ELECTRUM_CLIENTIF_HPP

#include"Elements/TxId.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Electrum {

/** struct Electrum::HistoryEntry
 *
 * @brief a transaction touching a script.
 * `height` is 0 or negative while unconfirmed.
 */
struct HistoryEntry {
	Elements::TxId txid;
	std::int64_t height;
};

/** class Electrum::ClientIF
 *
 * @brief interface to an object that provides
 * access to an Electrum server.
 *
 * @desc Every call is one blocking round trip.
 * Failures throw `Electrum::ApiError`.
 */
class ClientIF {
public:
	virtual ~ClientIF() { }

	/* History of the given locking script, in
	 * server order: confirmed by height, then
	 * mempool.  */
	virtual
	std::vector<HistoryEntry>
	get_history(std::vector<std::uint8_t> const& scriptPubKey) =0;

	/* Raw serialization of the transaction.  */
	virtual
	std::vector<std::uint8_t>
	get_raw_transaction(Elements::TxId const& txid) =0;

	/* Returns the txid the server reports.  */
	virtual
	std::string
	broadcast_raw(std::vector<std::uint8_t> const& tx) =0;
};

/** Electrum::ApiError
 *
 * @brief thrown when communications with
 * the Electrum server has problems.
 * If the server itself reported the error, the
 * message is the server's, unchanged.
 */
class ApiError : public Util::BacktraceException<std::runtime_error> {
public:
	ApiError(std::string const& e
		) : Util::BacktraceException<std::runtime_error>(e) { }
};

/** Electrum::script_hash
 *
 * @brief the key Electrum indexes scripts by:
 * the SHA256 of the script, hex-encoded with its
 * bytes reversed.
 */
std::string script_hash(std::vector<std::uint8_t> const& scriptPubKey);

}

#endif /* !defined(ELECTRUM_CLIENTIF_HPP) */
