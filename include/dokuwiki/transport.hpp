#ifndef DOKUWIKI_TRANSPORT_HPP
#define DOKUWIKI_TRANSPORT_HPP

#include <dokuwiki/types.hpp>
#include <memory>
#include <string>
#include <vector>

namespace dokuwiki
{

/**
 * Abstract transport interface for the wiki's remote procedure calls.
 *
 * This is a low-level interface that performs exactly one request/response
 * exchange per call and keeps the HTTP cookie jar. The SessionManager and
 * WikiClient build on top of this to implement authentication and the typed
 * content API.
 *
 * Implementations include:
 * - CurlTransport: JSON-RPC 2.0 over HTTP(S) using libcurl
 * - FakeWiki (tests): in-memory wiki answering the same wire format
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Invoke a remote method.
     * @param method Remote method name, e.g. "core.getPage"
     * @param params Named parameters (JSON object)
     * @return The "result" member of the response
     * @throws WikiError subclass classifying the failure (never retries)
     */
    virtual json call(const std::string& method, const json& params) = 0;

    /**
     * Current cookie jar as Netscape cookie-file lines.
     */
    virtual std::vector<std::string> cookies() const = 0;

    /**
     * Replace the cookie jar with the given Netscape cookie-file lines.
     */
    virtual void set_cookies(const std::vector<std::string>& lines) = 0;

    /**
     * Drop every cookie (used before a fresh login).
     */
    virtual void clear_cookies() = 0;

    /**
     * Endpoint description for diagnostics.
     */
    virtual std::string endpoint() const = 0;
};

// Factory for the production transport (JSON-RPC over libcurl).
// wiki_url is the wiki base URL, e.g. "https://wiki.example.com".
std::unique_ptr<Transport> create_curl_transport(const std::string& wiki_url,
                                                 long timeout_seconds);

} // namespace dokuwiki

#endif // DOKUWIKI_TRANSPORT_HPP
