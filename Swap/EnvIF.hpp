#ifndef SWAP_ENVIF_HPP
#define SWAP_ENVIF_HPP

#include<string>

namespace Swap {

/** class Swap::EnvIF
 *
 * @brief abstract interface to the local
 * environment the swap code is running in.
 *
 * @desc Only logging goes through here; the chain
 * is reached through `Electrum::ClientIF`.
 * Calls are synchronous.
 */
class EnvIF {
public:
	virtual ~EnvIF() { }

	/** Swap::EnvIF::logd
	 *
	 * @brief prints a Debug-level log.
	 */
	virtual
	void logd(std::string) =0;

	/** Swap::EnvIF::loge
	 *
	 * @brief prints an Error-level log.
	 */
	virtual
	void loge(std::string) =0;
};

}

#endif /* !defined(SWAP_ENVIF_HPP) */
