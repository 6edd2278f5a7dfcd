#ifndef SWAP_STREAMENV_HPP
#define SWAP_STREAMENV_HPP

#include"Swap/EnvIF.hpp"
#include<iosfwd>

namespace Swap {

/** class Swap::StreamEnv
 *
 * @brief an `EnvIF` that writes one line per log
 * to a stream, `std::cerr` unless told otherwise.
 *
 * @desc Each line is `<level>: <message>`.
 * Debug lines are dropped unless `verbose`.
 */
class StreamEnv : public EnvIF {
private:
	std::ostream& os;
	bool verbose;

	void print(char const* level, std::string const& msg);

public:
	StreamEnv();
	explicit
	StreamEnv(std::ostream& os_, bool verbose_ = true)
		: os(os_), verbose(verbose_) { }

	void logd(std::string) override;
	void loge(std::string) override;
};

}

#endif /* !defined(SWAP_STREAMENV_HPP) */
