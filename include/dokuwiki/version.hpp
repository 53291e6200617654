#ifndef DOKUWIKI_VERSION_HPP
#define DOKUWIKI_VERSION_HPP

#include <string>

namespace dokuwiki
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// Oldest DokuWiki remote API this helper speaks
constexpr int MIN_API_VERSION = 14;

std::string version_string();

// "git-remote-dokuwiki/<version>", sent as the HTTP user agent
std::string user_agent();

} // namespace dokuwiki

#endif // DOKUWIKI_VERSION_HPP
