#include"Electrum/Client.hpp"
#include"Electrum/Detail/Reply.hpp"
#include"Util/Str.hpp"
#include<curl/curl.h>
#include<errno.h>
#include<poll.h>
#include<sstream>
#include<string.h>

namespace {

auto constexpr max_reply_size = std::size_t(64 * 1024 * 1024);

/* Class to create a CURL easy handle connected to
 * the server, then execute one request on it.  */
class Session {
private:
	Electrum::Config const& config;

	std::vector<char> errbuf;
	CURL* curl;
	curl_socket_t sock;

	std::string received;

	explicit
	Session(Electrum::Config const& config_) : config(config_) {
		errbuf.resize(CURL_ERROR_SIZE);
		for (auto& b : errbuf)
			b = 0;
		curl = curl_easy_init();
		if (!curl)
			throw Electrum::ApiError("curl_easy_init failed");
		curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, &errbuf[0]);
	}
	~Session() {
		curl_easy_cleanup(curl);
	}

	void fail(CURLcode ret) {
		auto msg = std::string(curl_easy_strerror(ret));
		if (errbuf[0] != 0)
			msg += ": " + std::string(&errbuf[0]);
		throw Electrum::ApiError(msg);
	}

	void connect() {
		auto url = std::string(config.tls ? "https://" : "http://")
			 + config.electrum_url
			 ;
		curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
		curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 1L);
		curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
		curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config.timeout);
		curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
		if (config.tls) {
			auto verify = config.validate_domain ? 1L : 0L;
			curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify);
			curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify * 2);
		}
		if (config.proxy != "") {
			curl_easy_setopt(curl, CURLOPT_PROXY, config.proxy.c_str());
			curl_easy_setopt( curl, CURLOPT_PROXYTYPE
					, (long)CURLPROXY_SOCKS5_HOSTNAME
					);
		}

		auto ret = curl_easy_perform(curl);
		if (ret != CURLE_OK)
			fail(ret);
		ret = curl_easy_getinfo(curl, CURLINFO_ACTIVESOCKET, &sock);
		if (ret != CURLE_OK)
			fail(ret);
	}

	void wait(bool for_recv) {
		struct pollfd pfd;
		pfd.fd = sock;
		pfd.events = for_recv ? POLLIN : POLLOUT;
		pfd.revents = 0;
		auto res = poll(&pfd, 1, int(config.timeout * 1000));
		if (res < 0 && errno != EINTR)
			throw Electrum::ApiError(std::string("poll: ") + strerror(errno));
		if (res == 0)
			throw Electrum::ApiError("Electrum: timed out");
	}

	void send_all(std::string const& data) {
		auto sent_total = std::size_t(0);
		while (sent_total < data.size()) {
			auto sent = std::size_t(0);
			auto ret = curl_easy_send( curl
						 , data.data() + sent_total
						 , data.size() - sent_total
						 , &sent
						 );
			if (ret == CURLE_AGAIN) {
				wait(false);
				continue;
			}
			if (ret != CURLE_OK)
				fail(ret);
			sent_total += sent;
		}
	}

	std::string recv_line() {
		char buf[16384];
		for (;;) {
			auto nl = received.find('\n');
			if (nl != std::string::npos) {
				auto line = received.substr(0, nl);
				received.erase(0, nl + 1);
				return line;
			}
			if (received.size() > max_reply_size)
				throw Electrum::ApiError("Electrum: reply too large");

			auto nread = std::size_t(0);
			auto ret = curl_easy_recv(curl, buf, sizeof(buf), &nread);
			if (ret == CURLE_AGAIN) {
				wait(true);
				continue;
			}
			if (ret != CURLE_OK)
				fail(ret);
			if (nread == 0)
				throw Electrum::ApiError("Electrum: server closed connection");
			received.append(buf, nread);
		}
	}

	Electrum::Detail::Reply
	run_core( std::string const& method
		, std::vector<std::string> const& params
		) {
		auto const id = std::uint64_t(1);

		auto os = std::ostringstream();
		os << "{\"jsonrpc\":\"2.0\",\"id\":" << id
		   << ",\"method\":" << Electrum::Detail::jsonify_string(method)
		   << ",\"params\":[";
		auto first = true;
		for (auto const& p : params) {
			if (!first)
				os << ",";
			first = false;
			os << Electrum::Detail::jsonify_string(p);
		}
		os << "]}\n";

		connect();
		send_all(os.str());

		for (;;) {
			auto reply = Electrum::Detail::Reply(recv_line());
			/* Skip notifications.  */
			if (!reply.has_id(id))
				continue;
			if (reply.is_error())
				throw Electrum::ApiError(reply.error_message());
			return reply;
		}
	}

public:
	static
	Electrum::Detail::Reply run( Electrum::Config const& config
				   , std::string const& method
				   , std::vector<std::string> const& params
				   ) {
		Session self(config);
		return self.run_core(method, params);
	}
};

}

namespace Electrum {

class Client::Impl {
private:
	Electrum::Config config;

public:
	Impl() =delete;
	Impl(Impl const&) =delete;
	Impl(Impl&&) =delete;

	explicit
	Impl(Electrum::Config config_) : config(std::move(config_)) { }

	std::vector<HistoryEntry>
	get_history(std::vector<std::uint8_t> const& scriptPubKey) {
		return Session::run( config
				   , "blockchain.scripthash.get_history"
				   , {script_hash(scriptPubKey)}
				   ).result_history();
	}
	std::vector<std::uint8_t>
	get_raw_transaction(Elements::TxId const& txid) {
		auto hex = Session::run( config
				       , "blockchain.transaction.get"
				       , {std::string(txid)}
				       ).result_string();
		try {
			return Util::Str::hexread(hex);
		} catch (Util::Str::HexParseFailure const& e) {
			throw ApiError(std::string("Electrum: bad transaction hex: ") + e.what());
		}
	}
	std::string
	broadcast_raw(std::vector<std::uint8_t> const& tx) {
		return Session::run( config
				   , "blockchain.transaction.broadcast"
				   , {Util::Str::hexdump(tx)}
				   ).result_string();
	}
};

Client::Client(Client&&) =default;
Client::~Client() =default;
Client::Client(Electrum::Config config)
	: pimpl(std::make_unique<Impl>(std::move(config))) { }

std::vector<HistoryEntry>
Client::get_history(std::vector<std::uint8_t> const& scriptPubKey) {
	return pimpl->get_history(scriptPubKey);
}
std::vector<std::uint8_t>
Client::get_raw_transaction(Elements::TxId const& txid) {
	return pimpl->get_raw_transaction(txid);
}
std::string
Client::broadcast_raw(std::vector<std::uint8_t> const& tx) {
	return pimpl->broadcast_raw(tx);
}

}
