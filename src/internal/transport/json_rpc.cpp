#include "json_rpc.hpp"

#include <algorithm>
#include <cctype>

namespace dokuwiki::rpc
{

namespace
{
std::string lowercase(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string excerpt(const std::string& body)
{
    constexpr size_t max_length = 200;
    if (body.size() <= max_length)
        return body;
    return body.substr(0, max_length) + "...";
}
} // namespace

std::string encode_request(const std::string& method, const json& params, std::uint64_t id)
{
    json request = {{"jsonrpc", "2.0"},
                    {"method", method},
                    {"params", params.is_null() ? json::object() : params},
                    {"id", id}};
    return request.dump();
}

std::string encode_result(const json& result, std::uint64_t id)
{
    json response = {{"jsonrpc", "2.0"}, {"result", result}, {"error", nullptr}, {"id", id}};
    return response.dump();
}

std::string encode_error(int code, const std::string& message, std::uint64_t id)
{
    json response = {{"jsonrpc", "2.0"},
                     {"result", nullptr},
                     {"error", {{"code", code}, {"message", message}}},
                     {"id", id}};
    return response.dump();
}

ErrorKind classify_api_error(int code, const std::string& message)
{
    switch (code)
    {
    case CODE_PAGE_NOT_FOUND:
    case CODE_MEDIA_NOT_FOUND:
        return ErrorKind::NotFound;
    case CODE_PAGE_READ_DENIED:
    case CODE_PAGE_WRITE_DENIED:
    case CODE_PAGE_LOCKED_DENIED:
    case CODE_MEDIA_READ_DENIED:
    case CODE_MEDIA_DELETE_DENIED:
    case CODE_MEDIA_WRITE_DENIED:
        return ErrorKind::Forbidden;
    case CODE_METHOD_NOT_AUTHORIZED:
        return ErrorKind::Unauthenticated;
    case CODE_METHOD_NOT_FOUND:
        return ErrorKind::RemoteProtocol;
    default:
        break;
    }

    std::string text = lowercase(message);
    if (text.find("not logged in") != std::string::npos ||
        text.find("unauthorized") != std::string::npos)
        return ErrorKind::Unauthenticated;
    if (text.find("does not exist") != std::string::npos)
        return ErrorKind::NotFound;
    return ErrorKind::RemoteProtocol;
}

void throw_error(ErrorKind kind, const std::string& message, int http_status)
{
    switch (kind)
    {
    case ErrorKind::Authentication:
        throw AuthenticationError(message);
    case ErrorKind::Unauthenticated:
        throw UnauthenticatedError(message);
    case ErrorKind::Forbidden:
        throw ForbiddenError(message);
    case ErrorKind::NotFound:
        throw NotFoundError(message);
    case ErrorKind::Transport:
        throw TransportError(message, http_status);
    case ErrorKind::Configuration:
        throw ConfigurationError(message);
    case ErrorKind::Stream:
        throw StreamError(message);
    case ErrorKind::Conflict:
    case ErrorKind::AmbiguousMapping:
    case ErrorKind::RemoteProtocol:
        break;
    }
    throw RemoteProtocolError(message);
}

json decode_response(int http_status, const std::string& body, const std::string& method)
{
    json response;
    bool parsed = false;
    try
    {
        response = json::parse(body);
        parsed = response.is_object();
    }
    catch (const json::exception&)
    {
        parsed = false;
    }

    const bool has_error = parsed && response.contains("error") && !response["error"].is_null();
    std::string api_message;
    int api_code = 0;
    if (has_error)
    {
        const json& error = response["error"];
        try
        {
            api_code = error.value("code", 0);
            api_message = error.value("message", std::string("unknown error"));
        }
        catch (const json::exception& e)
        {
            throw RemoteProtocolError(method + ": malformed error object " +
                                      excerpt(error.dump()) + " (" + e.what() + ")");
        }
    }

    if (http_status == 401)
        throw UnauthenticatedError(method + ": " +
                                   (has_error ? api_message : std::string("not logged in")));
    if (http_status == 403)
        throw ForbiddenError(method + ": " +
                             (has_error ? api_message : std::string("access denied")));

    if (http_status < 200 || http_status >= 300)
    {
        if (has_error)
            throw_error(classify_api_error(api_code, api_message),
                        method + ": " + api_message + " (code " + std::to_string(api_code) + ")",
                        http_status);
        if (http_status >= 500)
            throw TransportError(method + ": HTTP " + std::to_string(http_status) + ": " +
                                     excerpt(body),
                                 http_status);
        throw RemoteProtocolError(method + ": HTTP " + std::to_string(http_status) +
                                  " (is the JSON-RPC API enabled?): " + excerpt(body));
    }

    if (!parsed)
        throw RemoteProtocolError(method + ": malformed response: " + excerpt(body));

    if (has_error)
        throw_error(classify_api_error(api_code, api_message),
                    method + ": " + api_message + " (code " + std::to_string(api_code) + ")");

    if (!response.contains("result"))
        throw RemoteProtocolError(method + ": response has no result");

    return response["result"];
}

} // namespace dokuwiki::rpc
