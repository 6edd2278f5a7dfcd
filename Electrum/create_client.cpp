#include"Electrum/Client.hpp"
#include"Electrum/Config.hpp"
#include"Electrum/create_client.hpp"

namespace Electrum {

std::unique_ptr<Electrum::ClientIF>
create_client(Electrum::Config const& config) {
	auto const& url = config.electrum_url;
	auto colon = url.rfind(':');
	if ( colon == std::string::npos
	  || colon == 0
	  || colon + 1 == url.size()
	  || url.find("://") != std::string::npos
	   )
		throw ApiError("Electrum: expected host:port, got " + url);
	for (auto i = colon + 1; i < url.size(); ++i)
		if (url[i] < '0' || url[i] > '9')
			throw ApiError("Electrum: bad port in " + url);
	return std::make_unique<Electrum::Client>(config);
}

}
