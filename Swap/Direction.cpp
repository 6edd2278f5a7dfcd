#include"Swap/Direction.hpp"
#include<stdexcept>

namespace Swap {

std::string direction_name(Direction d) {
	switch (d) {
	case Submarine: return "submarine";
	case ReverseSubmarine: return "reverse-submarine";
	}
	throw std::logic_error("Swap::direction_name: invalid Direction");
}

}
