#include"Swap/StreamEnv.hpp"
#include"Util/format.hpp"
#include<iostream>

namespace Swap {

StreamEnv::StreamEnv() : os(std::cerr), verbose(true) { }

void StreamEnv::print(char const* level, std::string const& msg) {
	os << Util::format("%s: %s", level, msg.c_str()) << std::endl;
}

void StreamEnv::logd(std::string msg) {
	if (!verbose)
		return;
	print("debug", msg);
}
void StreamEnv::loge(std::string msg) {
	print("error", msg);
}

}
