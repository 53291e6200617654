#include "curl_transport.hpp"

#include "json_rpc.hpp"

#include <curl/curl.h>
#include <dokuwiki/errors.hpp>
#include <dokuwiki/log.hpp>
#include <dokuwiki/version.hpp>
#include <mutex>

namespace dokuwiki
{

namespace
{
std::once_flag global_init_flag;

size_t append_body(char* data, size_t size, size_t nmemb, void* userdata)
{
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

std::string strip_trailing_slash(std::string url)
{
    while (!url.empty() && url.back() == '/')
        url.pop_back();
    return url;
}
} // namespace

CurlTransport::CurlTransport(const std::string& wiki_url, long timeout_seconds)
    : handle_(nullptr), endpoint_(strip_trailing_slash(wiki_url) + rpc::ENDPOINT_PATH),
      timeout_seconds_(timeout_seconds)
{
    std::call_once(global_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

    handle_ = curl_easy_init();
    if (!handle_)
        throw TransportError("failed to initialize libcurl");

    // An empty file name enables the in-memory cookie engine
    curl_easy_setopt(handle_, CURLOPT_COOKIEFILE, "");
    curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle_, CURLOPT_POSTREDIR, static_cast<long>(CURL_REDIR_POST_ALL));
    curl_easy_setopt(handle_, CURLOPT_USERAGENT, user_agent().c_str());
    curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle_, CURLOPT_ACCEPT_ENCODING, "");
}

CurlTransport::~CurlTransport()
{
    if (handle_)
        curl_easy_cleanup(handle_);
}

json CurlTransport::call(const std::string& method, const json& params)
{
    const std::string request = rpc::encode_request(method, params, next_id_++);
    std::string body;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(handle_, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, request.c_str());
    curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.size()));
    curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(handle_, CURLOPT_WRITEDATA, static_cast<void*>(&body));
    curl_easy_setopt(handle_, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT, timeout_seconds_);
    // Wire tracing only beyond -vv
    curl_easy_setopt(handle_, CURLOPT_VERBOSE, log::verbosity() > 3 ? 1L : 0L);

    log::debug("rpc " + method);
    CURLcode res = curl_easy_perform(handle_);
    curl_slist_free_all(headers);

    if (res != CURLE_OK)
    {
        std::string reason = curl_easy_strerror(res);
        if (res == CURLE_OPERATION_TIMEDOUT)
            reason = "timed out after " + std::to_string(timeout_seconds_) + "s";
        throw TransportError(method + ": " + endpoint_ + ": " + reason);
    }

    long status = 0;
    curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &status);
    return rpc::decode_response(static_cast<int>(status), body, method);
}

std::vector<std::string> CurlTransport::cookies() const
{
    std::vector<std::string> lines;
    struct curl_slist* list = nullptr;
    CURLcode res = curl_easy_getinfo(handle_, CURLINFO_COOKIELIST, &list);
    if (res != CURLE_OK)
    {
        log::warning(std::string("cannot read cookie jar: ") + curl_easy_strerror(res));
        return lines;
    }
    for (struct curl_slist* node = list; node; node = node->next)
        lines.emplace_back(node->data);
    curl_slist_free_all(list);
    return lines;
}

void CurlTransport::set_cookies(const std::vector<std::string>& lines)
{
    clear_cookies();
    for (const auto& line : lines)
        curl_easy_setopt(handle_, CURLOPT_COOKIELIST, line.c_str());
}

void CurlTransport::clear_cookies()
{
    curl_easy_setopt(handle_, CURLOPT_COOKIELIST, "ALL");
}

std::unique_ptr<Transport> create_curl_transport(const std::string& wiki_url,
                                                 long timeout_seconds)
{
    return std::make_unique<CurlTransport>(wiki_url, timeout_seconds);
}

} // namespace dokuwiki
