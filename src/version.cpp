#include <dokuwiki/version.hpp>
#include <sstream>

namespace dokuwiki
{

std::string version_string()
{
    std::ostringstream oss;
    oss << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH;
    return oss.str();
}

std::string user_agent()
{
    return "git-remote-dokuwiki/" + version_string();
}

} // namespace dokuwiki
