#include"Electrum/Detail/Reply.hpp"
#include"Util/Str.hpp"
#include<iomanip>
#include<sstream>

/* jsmn has all its code in the jsmn.h header, so instantiate all its
 * code into this compilation unit.
 */
#define JSMN_STATIC 1		/* Everything in this compilation unit.  */
#undef JSMN_HEADER		/* Not header-only.  */
#define JSMN_STRICT 1		/* Reject sloppy JSON.  */
# include <jsmn.h>

namespace Electrum { namespace Detail {

Reply::Reply(std::string line) : text(std::move(line)) {
	auto parser = jsmn_parser();
	auto jtoks = std::vector<jsmntok_t>(64);
	for (;;) {
		jsmn_init(&parser);
		auto res = jsmn_parse( &parser
				     , text.data(), text.size()
				     , &jtoks[0], jtoks.size()
				     );
		if (res == JSMN_ERROR_NOMEM) {
			jtoks.resize(jtoks.size() * 2);
			continue;
		}
		if (res < 1)
			throw ApiError("Electrum: unparseable reply: " + text);
		jtoks.resize(std::size_t(res));
		break;
	}
	for (auto const& t : jtoks)
		toks.push_back(Token{int(t.type), t.start, t.end, t.size});
	if (!is_object(0))
		throw ApiError("Electrum: reply is not an object: " + text);
}

std::size_t Reply::skip(std::size_t i) const {
	auto end = toks[i].end;
	++i;
	while (i < toks.size() && toks[i].start < end)
		++i;
	return i;
}
std::size_t Reply::find(std::size_t obj, char const* key) const {
	auto i = obj + 1;
	for (auto n = 0; n < toks[obj].size; ++n) {
		if (i + 1 >= toks.size())
			return 0;
		auto value = i + 1;
		if (is_string(i) && raw(i) == key)
			return value;
		i = skip(value);
	}
	return 0;
}
std::string Reply::raw(std::size_t i) const {
	return text.substr( std::size_t(toks[i].start)
			  , std::size_t(toks[i].end - toks[i].start)
			  );
}
bool Reply::is_string(std::size_t i) const {
	return toks[i].type == JSMN_STRING;
}
bool Reply::is_object(std::size_t i) const {
	return toks[i].type == JSMN_OBJECT;
}
bool Reply::is_array(std::size_t i) const {
	return toks[i].type == JSMN_ARRAY;
}
std::string Reply::string_at(std::size_t i) const {
	if (!is_string(i))
		throw ApiError("Electrum: expected a string: " + raw(i));
	return unescape(raw(i));
}
std::int64_t Reply::integer_at(std::size_t i) const {
	if (toks[i].type != JSMN_PRIMITIVE)
		throw ApiError("Electrum: expected a number: " + raw(i));
	auto is = std::istringstream(raw(i));
	auto ret = std::int64_t();
	is >> ret;
	if (!is)
		throw ApiError("Electrum: expected a number: " + raw(i));
	return ret;
}

bool Reply::has_id(std::uint64_t id) const {
	auto i = find(0, "id");
	if (i == 0 || toks[i].type != JSMN_PRIMITIVE)
		return false;
	return raw(i) == std::to_string(id);
}
bool Reply::is_error() const {
	auto i = find(0, "error");
	return i != 0 && raw(i) != "null";
}
std::string Reply::error_message() const {
	auto i = find(0, "error");
	if (i == 0)
		return "";
	if (is_string(i))
		return string_at(i);
	if (is_object(i)) {
		auto m = find(i, "message");
		if (m != 0 && is_string(m))
			return string_at(m);
	}
	return raw(i);
}

std::string Reply::result_string() const {
	auto i = find(0, "result");
	if (i == 0)
		throw ApiError("Electrum: reply has no result: " + text);
	return string_at(i);
}
std::vector<HistoryEntry> Reply::result_history() const {
	auto i = find(0, "result");
	if (i == 0 || !is_array(i))
		throw ApiError("Electrum: history is not an array: " + text);
	auto ret = std::vector<HistoryEntry>();
	auto e = i + 1;
	for (auto n = 0; n < toks[i].size; ++n) {
		if (e >= toks.size() || !is_object(e))
			throw ApiError("Electrum: bad history entry: " + text);
		auto h = find(e, "tx_hash");
		auto height = find(e, "height");
		if (h == 0 || height == 0)
			throw ApiError("Electrum: bad history entry: " + raw(e));
		try {
			ret.push_back(HistoryEntry{ Elements::TxId(string_at(h))
						  , integer_at(height)
						  });
		} catch (Util::Str::HexParseFailure const&) {
			throw ApiError("Electrum: bad txid in history: " + raw(h));
		} catch (std::invalid_argument const&) {
			throw ApiError("Electrum: bad txid in history: " + raw(h));
		}
		e = skip(e);
	}
	return ret;
}

std::string jsonify_string(std::string const& s) {
	std::ostringstream os;
	os << '"';
	for (auto c : s) {
		switch (c) {
		case '\"': os << "\\\""; break;
		case '\\': os << "\\\\"; break;
		case '\b': os << "\\b"; break;
		case '\f': os << "\\f"; break;
		case '\n': os << "\\n"; break;
		case '\r': os << "\\r"; break;
		case '\t': os << "\\t"; break;
		default:
			if ((unsigned char) c < 32) {
				os << "\\u00"
				   << std::hex << std::setfill('0') << std::setw(2)
				   << ((unsigned int) c)
				   << std::dec
				   ;
			} else {
				os << c;
			}
			break;
		}
	}
	os << '"';
	return os.str();
}

std::string unescape(std::string const& s) {
	std::ostringstream os;
	for (auto i = std::size_t(0); i < s.size(); ) {
		auto c = s[i++];
		if (c != '\\' || i >= s.size()) {
			os << c;
			continue;
		}
		c = s[i++];
		switch (c) {
		case 'b': os << '\b'; break;
		case 'f': os << '\f'; break;
		case 'n': os << '\n'; break;
		case 'r': os << '\r'; break;
		case 't': os << '\t'; break;
		case 'u': {
			if (i + 4 > s.size())
				throw ApiError("Electrum: truncated \\u escape");
			auto hex = std::vector<std::uint8_t>();
			try {
				hex = Util::Str::hexread(s.substr(i, 4));
			} catch (Util::Str::HexParseFailure const&) {
				throw ApiError( "Electrum: bad \\u escape: "
					      + s.substr(i, 4)
					      );
			}
			i += 4;
			auto cp = (std::uint16_t(hex[0]) << 8)
				+ std::uint16_t(hex[1])
				;
			/* Re-encode in UTF-8.  */
			if (cp < 0x80) {
				os << char(cp);
			} else if (cp < 0x800) {
				os << char(((cp >> 6) & 0x1F) | 0xC0)
				   << char((cp & 0x3F) | 0x80)
				   ;
			} else {
				os << char(((cp >> 12) & 0x0F) | 0xE0)
				   << char(((cp >> 6) & 0x3F) | 0x80)
				   << char((cp & 0x3F) | 0x80)
				   ;
			}
		} break;
		/* '"', '\\' and '/' stand for themselves.  */
		default: os << c; break;
		}
	}
	return os.str();
}

}}
