#include"Swap/Error.hpp"

namespace Swap {

std::string error_kind_name(ErrorKind k) {
	switch (k) {
	case Input: return "input";
	case Transaction: return "transaction";
	case Network: return "network";
	}
	throw std::logic_error("Swap::error_kind_name: invalid ErrorKind");
}

}
