#ifndef ELECTRUM_CLIENT_HPP
#define ELECTRUM_CLIENT_HPP

#include"Electrum/ClientIF.hpp"
#include"Electrum/Config.hpp"
#include<memory>

namespace Electrum {

/** class Electrum::Client
 *
 * @brief talks newline-delimited JSON-RPC to an
 * Electrum server over TCP or TLS.
 *
 * @desc libcurl opens the connection (and does the
 * TLS handshake and any SOCKS5 proxying) in
 * connect-only mode; each call then opens its own
 * connection, sends one request, reads one reply,
 * and closes.
 */
class Client : public ClientIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Client() =delete;
	Client(Client const&) =delete;
	Client(Client&&);
	~Client();

	explicit
	Client(Electrum::Config config);

	std::vector<HistoryEntry>
	get_history(std::vector<std::uint8_t> const& scriptPubKey) override;
	std::vector<std::uint8_t>
	get_raw_transaction(Elements::TxId const& txid) override;
	std::string
	broadcast_raw(std::vector<std::uint8_t> const& tx) override;
};

}

#endif /* !defined(ELECTRUM_CLIENT_HPP) */
