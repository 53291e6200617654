#ifndef DOKUWIKI_INTERNAL_TRANSPORT_JSON_RPC_HPP
#define DOKUWIKI_INTERNAL_TRANSPORT_JSON_RPC_HPP

#include <cstdint>
#include <dokuwiki/errors.hpp>
#include <dokuwiki/types.hpp>
#include <string>

namespace dokuwiki::rpc
{

// Path of the JSON-RPC endpoint relative to the wiki base URL
constexpr const char* ENDPOINT_PATH = "/lib/exe/jsonrpc.php";

// DokuWiki remote API error codes this helper reacts to
constexpr int CODE_PAGE_READ_DENIED = 111;
constexpr int CODE_PAGE_WRITE_DENIED = 112;
constexpr int CODE_PAGE_LOCKED_DENIED = 114;
constexpr int CODE_PAGE_NOT_FOUND = 121;
constexpr int CODE_MEDIA_READ_DENIED = 211;
constexpr int CODE_MEDIA_DELETE_DENIED = 212;
constexpr int CODE_MEDIA_WRITE_DENIED = 215;
constexpr int CODE_MEDIA_NOT_FOUND = 221;
constexpr int CODE_METHOD_NOT_FOUND = -32601;
constexpr int CODE_METHOD_NOT_AUTHORIZED = -32604;

// Build a JSON-RPC 2.0 request body
std::string encode_request(const std::string& method, const json& params, std::uint64_t id);

// Build a JSON-RPC 2.0 response body (used by test doubles)
std::string encode_result(const json& result, std::uint64_t id);
std::string encode_error(int code, const std::string& message, std::uint64_t id);

// Map an API-level error to the error taxonomy
ErrorKind classify_api_error(int code, const std::string& message);

// Throw the WikiError subclass matching kind
[[noreturn]] void throw_error(ErrorKind kind, const std::string& message, int http_status = 0);

// Decode one HTTP response into the call's result, or throw the classified error
json decode_response(int http_status, const std::string& body, const std::string& method);

} // namespace dokuwiki::rpc

#endif // DOKUWIKI_INTERNAL_TRANSPORT_JSON_RPC_HPP
