#include <dokuwiki/errors.hpp>

namespace dokuwiki
{

const char* error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Authentication:
        return "authentication failed";
    case ErrorKind::Unauthenticated:
        return "unauthenticated";
    case ErrorKind::Forbidden:
        return "forbidden";
    case ErrorKind::NotFound:
        return "not found";
    case ErrorKind::Conflict:
        return "conflict";
    case ErrorKind::RemoteProtocol:
        return "remote protocol error";
    case ErrorKind::Transport:
        return "transport error";
    case ErrorKind::AmbiguousMapping:
        return "ambiguous mapping";
    case ErrorKind::Configuration:
        return "configuration error";
    case ErrorKind::Stream:
        return "stream error";
    }
    return "unknown error";
}

} // namespace dokuwiki
