#ifndef ELECTRUM_CONFIG_HPP
#define ELECTRUM_CONFIG_HPP

#include"Elements/Network.hpp"
#include<string>
#include<utility>

namespace Electrum {

/** struct Electrum::Config
 *
 * @brief where and how to reach an Electrum
 * server for a network.
 *
 * @desc Passed by value to everything that talks
 * to the chain; nothing keeps a process-wide
 * default.
 */
struct Config {
	Elements::Network network;
	/* "host:port".  */
	std::string electrum_url;
	bool tls;
	/* Check the server certificate and host name.  */
	bool validate_domain;
	/* SOCKS5 proxy to use.  Empty string means no proxy.  */
	std::string proxy;
	/* Connect and per-read timeout, in seconds.  */
	long timeout;

	Config( Elements::Network network_
	      , std::string electrum_url_
	      , bool tls_ = true
	      , bool validate_domain_ = true
	      , std::string proxy_ = ""
	      , long timeout_ = 30
	      ) : network(network_)
		, electrum_url(std::move(electrum_url_))
		, tls(tls_)
		, validate_domain(validate_domain_)
		, proxy(std::move(proxy_))
		, timeout(timeout_)
		{ }

	/* blockstream.info:995 over TLS.  */
	static Config default_liquid();
	/* blockstream.info:465 over TLS.  */
	static Config default_liquid_testnet();
	static Config default_for(Elements::Network);
};

}

#endif /* !defined(ELECTRUM_CONFIG_HPP) */
