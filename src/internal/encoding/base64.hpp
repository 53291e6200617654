#ifndef DOKUWIKI_INTERNAL_ENCODING_BASE64_HPP
#define DOKUWIKI_INTERNAL_ENCODING_BASE64_HPP

#include <string>

namespace dokuwiki
{
namespace encoding
{

std::string base64_encode(const std::string& data);

// Whitespace is ignored; throws RemoteProtocolError on malformed input
std::string base64_decode(const std::string& text);

} // namespace encoding
} // namespace dokuwiki

#endif // DOKUWIKI_INTERNAL_ENCODING_BASE64_HPP
