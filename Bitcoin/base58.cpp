#include"Bitcoin/base58.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"
#include<algorithm>

namespace {

auto const alphabet = std::string(
	"123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"
);

std::string encode(std::vector<std::uint8_t> const& data) {
	auto zeroes = std::size_t(0);
	while (zeroes < data.size() && data[zeroes] == 0)
		++zeroes;

	/* log(256) / log(58), rounded up.  */
	auto b58 = std::vector<std::uint8_t>(
		(data.size() - zeroes) * 138 / 100 + 1
	);
	auto length = std::size_t(0);
	for (auto i = zeroes; i < data.size(); ++i) {
		auto carry = int(data[i]);
		auto j = std::size_t(0);
		for ( auto it = b58.rbegin()
		    ; (carry != 0 || j < length) && it != b58.rend()
		    ; ++it, ++j
		    ) {
			carry += 256 * (*it);
			*it = std::uint8_t(carry % 58);
			carry /= 58;
		}
		length = j;
	}

	auto it = b58.begin() + (b58.size() - length);
	while (it != b58.end() && *it == 0)
		++it;

	auto ret = std::string(zeroes, '1');
	for (; it != b58.end(); ++it)
		ret.push_back(alphabet[*it]);
	return ret;
}

bool decode(std::vector<std::uint8_t>& out, std::string const& s) {
	auto p = s.begin();
	auto zeroes = std::size_t(0);
	while (p != s.end() && *p == '1') {
		++zeroes;
		++p;
	}

	/* log(58) / log(256), rounded up.  */
	auto b256 = std::vector<std::uint8_t>((s.end() - p) * 733 / 1000 + 1);
	auto length = std::size_t(0);
	for (; p != s.end(); ++p) {
		auto pos = alphabet.find(*p);
		if (pos == std::string::npos)
			return false;
		auto carry = int(pos);
		auto i = std::size_t(0);
		for ( auto it = b256.rbegin()
		    ; (carry != 0 || i < length) && it != b256.rend()
		    ; ++it, ++i
		    ) {
			carry += 58 * (*it);
			*it = std::uint8_t(carry % 256);
			carry /= 256;
		}
		length = i;
	}

	auto it = b256.begin() + (b256.size() - length);
	out.assign(zeroes, 0);
	out.insert(out.end(), it, b256.end());
	return true;
}

void checksum(std::uint8_t out[4], std::vector<std::uint8_t> const& data) {
	std::uint8_t buf[32];
	Sha256::double_fun(data.data(), data.size()).to_buffer(buf);
	std::copy(buf, buf + 4, out);
}

}

namespace Bitcoin {

std::string base58check_encode(std::vector<std::uint8_t> const& payload) {
	auto data = payload;
	std::uint8_t check[4];
	checksum(check, payload);
	data.insert(data.end(), check, check + 4);
	return encode(data);
}

bool base58check_decode( std::vector<std::uint8_t>& payload
		       , std::string const& s
		       ) {
	auto data = std::vector<std::uint8_t>();
	if (!decode(data, s))
		return false;
	if (data.size() < 4)
		return false;

	auto body = std::vector<std::uint8_t>(data.begin(), data.end() - 4);
	std::uint8_t check[4];
	checksum(check, body);
	if (!std::equal(check, check + 4, data.end() - 4))
		return false;

	payload = std::move(body);
	return true;
}

}
