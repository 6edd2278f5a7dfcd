#ifndef ELECTRUM_DETAIL_REPLY_HPP
#define ELECTRUM_DETAIL_REPLY_HPP

#include"Electrum/ClientIF.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Electrum { namespace Detail {

/** class Electrum::Detail::Reply
 *
 * @brief one JSON-RPC response line from the
 * server, tokenized with jsmn.
 *
 * @desc Throws `Electrum::ApiError` if the line is
 * not a JSON object, and from the accessors if the
 * reply does not have the expected shape.
 */
class Reply {
public:
	struct Token {
		int type;
		int start;
		int end;
		int size;
	};

private:
	std::string text;
	std::vector<Token> toks;

	/* Index just past the subtree rooted at i.  */
	std::size_t skip(std::size_t i) const;
	/* Index of the value under `key` in the object
	 * at `obj`, or 0 if absent.  */
	std::size_t find(std::size_t obj, char const* key) const;
	std::string raw(std::size_t i) const;
	bool is_string(std::size_t i) const;
	bool is_object(std::size_t i) const;
	bool is_array(std::size_t i) const;
	std::string string_at(std::size_t i) const;
	std::int64_t integer_at(std::size_t i) const;

public:
	explicit Reply(std::string line);

	/* The "id" member is the given number.  */
	bool has_id(std::uint64_t id) const;
	/* A non-null "error" member is present.  */
	bool is_error() const;
	/* The server's message, from "error.message"
	 * or from "error" itself if a string.  */
	std::string error_message() const;

	std::string result_string() const;
	std::vector<HistoryEntry> result_history() const;
};

/* Quote and escape as a JSON string.  */
std::string jsonify_string(std::string const&);
/* Undo JSON string escapes.  */
std::string unescape(std::string const&);

}}

#endif /* !defined(ELECTRUM_DETAIL_REPLY_HPP) */
