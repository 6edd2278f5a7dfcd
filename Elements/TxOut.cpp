#include"Bitcoin/varbytes.hpp"
#include"Elements/TxOut.hpp"

std::ostream& operator<<(std::ostream& os, Elements::TxOut const& v) {
	return os << v.asset
		  << v.value
		  << v.nonce
		  << Bitcoin::varbytes(v.scriptPubKey)
		   ;
}
std::istream& operator>>(std::istream& is, Elements::TxOut& v) {
	return is >> v.asset
		  >> v.value
		  >> v.nonce
		  >> Bitcoin::varbytes(v.scriptPubKey)
		   ;
}
