#include "base64.hpp"

#include <cctype>
#include <dokuwiki/errors.hpp>
#include <openssl/evp.h>
#include <vector>

namespace dokuwiki
{
namespace encoding
{

std::string base64_encode(const std::string& data)
{
    if (data.empty())
        return {};

    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int length = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                 static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(length));
}

std::string base64_decode(const std::string& text)
{
    std::string compact;
    compact.reserve(text.size());
    for (char c : text)
    {
        if (!std::isspace(static_cast<unsigned char>(c)))
            compact.push_back(c);
    }
    if (compact.empty())
        return {};
    if (compact.size() % 4 != 0)
        throw RemoteProtocolError("malformed base64 payload (length " +
                                  std::to_string(compact.size()) + ")");

    std::vector<unsigned char> out(3 * compact.size() / 4 + 1);
    int length = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(compact.data()),
                                 static_cast<int>(compact.size()));
    if (length < 0)
        throw RemoteProtocolError("malformed base64 payload");

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (compact[compact.size() - 1] == '=')
        ++padding;
    if (compact[compact.size() - 2] == '=')
        ++padding;

    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(length) - padding);
}

} // namespace encoding
} // namespace dokuwiki
