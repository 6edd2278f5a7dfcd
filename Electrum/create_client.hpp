#ifndef ELECTRUM_CREATE_CLIENT_HPP
#define ELECTRUM_CREATE_CLIENT_HPP

#include<memory>

namespace Electrum { class ClientIF; }
namespace Electrum { struct Config; }

namespace Electrum {

/** Electrum::create_client
 *
 * @brief construct a fresh client for the given
 * configuration.
 *
 * @desc Throws `Electrum::ApiError` if the URL is
 * not of the form "host:port".
 */
std::unique_ptr<Electrum::ClientIF>
create_client(Electrum::Config const& config);

}

#endif /* !defined(ELECTRUM_CREATE_CLIENT_HPP) */
