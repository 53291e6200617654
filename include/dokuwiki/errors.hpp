#ifndef DOKUWIKI_ERRORS_HPP
#define DOKUWIKI_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace dokuwiki
{

// Every failure surfaced by the library is classified into exactly one kind.
enum class ErrorKind
{
    Authentication,   // all credential sources exhausted
    Unauthenticated,  // session missing or expired, retryable once per call
    Forbidden,        // ACL refusal
    NotFound,         // page, media file or revision does not exist
    Conflict,         // remote advanced since the last synchronization
    RemoteProtocol,   // malformed or unexpected remote response
    Transport,        // network-level failure or timeout
    AmbiguousMapping, // two wiki identities map to one local path
    Configuration,    // malformed configuration or unsupported remote
    Stream            // malformed fast-export input
};

const char* error_kind_name(ErrorKind kind);

// Base exception
class WikiError : public std::runtime_error
{
  public:
    WikiError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const
    {
        return kind_;
    }

  private:
    ErrorKind kind_;
};

class AuthenticationError : public WikiError
{
  public:
    explicit AuthenticationError(const std::string& message)
        : WikiError(ErrorKind::Authentication, message)
    {
    }
};

class UnauthenticatedError : public WikiError
{
  public:
    explicit UnauthenticatedError(const std::string& message)
        : WikiError(ErrorKind::Unauthenticated, message)
    {
    }
};

class ForbiddenError : public WikiError
{
  public:
    explicit ForbiddenError(const std::string& message) : WikiError(ErrorKind::Forbidden, message)
    {
    }
};

class NotFoundError : public WikiError
{
  public:
    explicit NotFoundError(const std::string& message) : WikiError(ErrorKind::NotFound, message) {}
};

// Non-fast-forward push; carries the path whose remote revision moved.
class ConflictError : public WikiError
{
  public:
    ConflictError(const std::string& message, const std::string& path)
        : WikiError(ErrorKind::Conflict, message), path_(path)
    {
    }

    const std::string& path() const
    {
        return path_;
    }

  private:
    std::string path_;
};

class RemoteProtocolError : public WikiError
{
  public:
    explicit RemoteProtocolError(const std::string& message)
        : WikiError(ErrorKind::RemoteProtocol, message)
    {
    }
};

// Network error; http_status is 0 when no response was received
class TransportError : public WikiError
{
  public:
    explicit TransportError(const std::string& message, int http_status = 0)
        : WikiError(ErrorKind::Transport, message), http_status_(http_status)
    {
    }

    int http_status() const
    {
        return http_status_;
    }

  private:
    int http_status_;
};

// Two wiki identities collide on one local path
class AmbiguousMappingError : public WikiError
{
  public:
    AmbiguousMappingError(const std::string& path, const std::string& first_id,
                          const std::string& second_id)
        : WikiError(ErrorKind::AmbiguousMapping,
                    "ambiguous mapping: '" + first_id + "' and '" + second_id +
                        "' both map to '" + path + "'"),
          path_(path), first_id_(first_id), second_id_(second_id)
    {
    }

    const std::string& path() const
    {
        return path_;
    }
    const std::string& first_id() const
    {
        return first_id_;
    }
    const std::string& second_id() const
    {
        return second_id_;
    }

  private:
    std::string path_;
    std::string first_id_;
    std::string second_id_;
};

class ConfigurationError : public WikiError
{
  public:
    explicit ConfigurationError(const std::string& message)
        : WikiError(ErrorKind::Configuration, message)
    {
    }
};

class StreamError : public WikiError
{
  public:
    explicit StreamError(const std::string& message) : WikiError(ErrorKind::Stream, message) {}
};

// Process-fatal kinds end the helper's command loop.
inline bool is_fatal(ErrorKind kind)
{
    return kind == ErrorKind::Authentication || kind == ErrorKind::Configuration;
}

} // namespace dokuwiki

#endif // DOKUWIKI_ERRORS_HPP
