#ifndef DOKUWIKI_INTERNAL_TRANSPORT_CURL_TRANSPORT_HPP
#define DOKUWIKI_INTERNAL_TRANSPORT_CURL_TRANSPORT_HPP

#include <cstdint>
#include <dokuwiki/transport.hpp>

typedef void CURL;

namespace dokuwiki
{

// JSON-RPC 2.0 over HTTP(S) POST. One easy handle is kept for the whole
// process so connections and the cookie engine are reused between calls.
class CurlTransport : public Transport
{
  public:
    CurlTransport(const std::string& wiki_url, long timeout_seconds);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    json call(const std::string& method, const json& params) override;

    std::vector<std::string> cookies() const override;
    void set_cookies(const std::vector<std::string>& lines) override;
    void clear_cookies() override;

    std::string endpoint() const override
    {
        return endpoint_;
    }

  private:
    CURL* handle_;
    std::string endpoint_;
    long timeout_seconds_;
    std::uint64_t next_id_ = 1;
};

} // namespace dokuwiki

#endif // DOKUWIKI_INTERNAL_TRANSPORT_CURL_TRANSPORT_HPP
