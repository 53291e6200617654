#ifndef DOKUWIKI_SESSION_HPP
#define DOKUWIKI_SESSION_HPP

#include <dokuwiki/credentials.hpp>
#include <dokuwiki/transport.hpp>
#include <dokuwiki/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dokuwiki
{

struct SessionSettings
{
    std::string wiki_url;
    std::string scheme = "https";
    std::string host;
    std::string user;
    std::optional<std::string> password;
    std::string cookie_file;
    bool check_api_version = true;
};

/**
 * Owns the authentication state for one wiki and routes every remote call.
 *
 * Credentials are acquired in priority order: explicit password, persisted
 * cookie (validated with core.whoAmI), external credential prompt. A call
 * rejected as unauthenticated triggers exactly one re-authentication and one
 * retry; a second rejection is fatal.
 */
class SessionManager
{
  public:
    enum class State
    {
        Unauthenticated,
        Authenticating,
        Authenticated
    };

    // Where the current session came from
    enum class Source
    {
        None,
        Password,
        Cookie,
        Prompt
    };

    SessionManager(Transport& transport, SessionSettings settings,
                   CredentialProvider* credentials);

    /**
     * Invoke a remote method with session handling.
     * @throws AuthenticationError when re-authentication does not help
     * @throws WikiError subclasses from the transport otherwise
     */
    json call(const std::string& method, const json& params = json::object());

    // Run the credential sources now
    void authenticate();

    // Load persisted state / log in eagerly; runs the API version check once
    void ensure_session();

    State state() const
    {
        return state_;
    }

    Source source() const
    {
        return source_;
    }

    // Number of re-authentications triggered by rejected calls
    int reauth_count() const
    {
        return reauth_count_;
    }

    int api_version() const
    {
        return api_version_;
    }

    const std::string& user() const
    {
        return user_;
    }

  private:
    bool try_password();
    bool try_cookie();
    bool try_prompt();
    bool login(const std::string& user, const std::string& password);
    bool probe();
    void persist();
    void check_api_version();

    Transport& transport_;
    SessionSettings settings_;
    CredentialProvider* credentials_;

    State state_ = State::Unauthenticated;
    Source source_ = Source::None;
    std::string user_;
    bool started_ = false;
    bool version_checked_ = false;
    int api_version_ = 0;
    int reauth_count_ = 0;
    std::vector<std::string> loaded_cookies_;
    std::vector<std::string> rejected_cookies_;
};

const char* session_state_name(SessionManager::State state);

} // namespace dokuwiki

#endif // DOKUWIKI_SESSION_HPP
