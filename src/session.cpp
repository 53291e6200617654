#include "internal/session/cookie_store.hpp"

#include <ctime>
#include <dokuwiki/errors.hpp>
#include <dokuwiki/log.hpp>
#include <dokuwiki/session.hpp>
#include <dokuwiki/version.hpp>

namespace dokuwiki
{

namespace
{
constexpr int PROBE_ATTEMPTS = 3;

std::int64_t now()
{
    return static_cast<std::int64_t>(std::time(nullptr));
}
} // namespace

const char* session_state_name(SessionManager::State state)
{
    switch (state)
    {
    case SessionManager::State::Unauthenticated:
        return "unauthenticated";
    case SessionManager::State::Authenticating:
        return "authenticating";
    case SessionManager::State::Authenticated:
        return "authenticated";
    }
    return "unknown";
}

SessionManager::SessionManager(Transport& transport, SessionSettings settings,
                               CredentialProvider* credentials)
    : transport_(transport), settings_(std::move(settings)), credentials_(credentials),
      user_(settings_.user)
{
}

// ============================================================================
// Calls
// ============================================================================

json SessionManager::call(const std::string& method, const json& params)
{
    ensure_session();

    try
    {
        return transport_.call(method, params);
    }
    catch (const UnauthenticatedError& e)
    {
        log::info("session rejected (" + std::string(e.what()) + "), re-authenticating");
        if (source_ == Source::Cookie)
            rejected_cookies_ = loaded_cookies_;
        state_ = State::Unauthenticated;
        source_ = Source::None;
        ++reauth_count_;
    }

    authenticate();

    try
    {
        return transport_.call(method, params);
    }
    catch (const UnauthenticatedError& e)
    {
        state_ = State::Unauthenticated;
        throw AuthenticationError(std::string(e.what()) + " (still rejected after logging in as " +
                                  (user_.empty() ? std::string("anonymous") : user_) + ")");
    }
}

void SessionManager::ensure_session()
{
    if (!started_)
    {
        started_ = true;
        if (settings_.password)
        {
            authenticate();
        }
        else
        {
            CookieStore store(settings_.cookie_file);
            if (auto cookies = store.load(settings_.wiki_url, user_, now()))
            {
                transport_.set_cookies(*cookies);
                loaded_cookies_ = *cookies;
                state_ = State::Authenticated;
                source_ = Source::Cookie;
                log::debug("session: reusing saved session from " + store.path());
            }
            else
            {
                log::debug("session: no saved session, calling anonymously");
            }
        }
    }

    if (settings_.check_api_version && !version_checked_)
    {
        version_checked_ = true;
        check_api_version();
    }
}

// ============================================================================
// Authentication
// ============================================================================

void SessionManager::authenticate()
{
    state_ = State::Authenticating;
    log::debug("session: authenticating against " + settings_.wiki_url);

    if (try_password())
        source_ = Source::Password;
    else if (try_cookie())
        source_ = Source::Cookie;
    else if (try_prompt())
        source_ = Source::Prompt;
    else
    {
        state_ = State::Unauthenticated;
        source_ = Source::None;
        throw AuthenticationError("cannot authenticate to " + settings_.wiki_url +
                                  ": set DOKUWIKI_PASSWORD or configure git credentials for " +
                                  settings_.host);
    }

    state_ = State::Authenticated;
    log::debug(std::string("session: ") + session_state_name(state_) + " as " +
               (user_.empty() ? std::string("(saved session)") : user_));

    if (source_ != Source::Cookie)
        persist();
}

bool SessionManager::try_password()
{
    if (!settings_.password || settings_.user.empty())
        return false;

    if (login(settings_.user, *settings_.password))
    {
        user_ = settings_.user;
        return true;
    }
    log::warning("login as " + settings_.user + " with DOKUWIKI_PASSWORD failed");
    return false;
}

bool SessionManager::try_cookie()
{
    CookieStore store(settings_.cookie_file);
    auto cookies = store.load(settings_.wiki_url, user_, now());
    if (!cookies)
        return false;
    if (*cookies == rejected_cookies_)
    {
        log::debug("session: saved session was rejected, removing " + store.path());
        store.remove();
        return false;
    }

    transport_.set_cookies(*cookies);
    if (probe())
    {
        loaded_cookies_ = *cookies;
        return true;
    }

    log::debug("session: saved session expired, removing " + store.path());
    transport_.clear_cookies();
    rejected_cookies_ = *cookies;
    store.remove();
    return false;
}

bool SessionManager::try_prompt()
{
    if (!credentials_)
        return false;

    Credential request;
    request.protocol = settings_.scheme;
    request.host = settings_.host;
    request.username = user_;

    auto credential = credentials_->fill(request);
    if (!credential)
        return false;

    credential->protocol = request.protocol;
    credential->host = request.host;
    if (login(credential->username, credential->password))
    {
        credentials_->approve(*credential);
        user_ = credential->username;
        return true;
    }

    credentials_->reject(*credential);
    log::warning("login as " + credential->username + " failed");
    return false;
}

bool SessionManager::login(const std::string& user, const std::string& password)
{
    transport_.clear_cookies();
    json result = transport_.call("core.login", {{"user", user}, {"pass", password}});
    if (!result.is_boolean())
        throw RemoteProtocolError("core.login: unexpected response " + result.dump());
    return result.get<bool>();
}

bool SessionManager::probe()
{
    for (int attempt = 1;; ++attempt)
    {
        try
        {
            json who = transport_.call("core.whoAmI", json::object());
            std::string login = who.is_object() ? who.value("login", std::string()) : "";
            if (login.empty())
                return false;
            if (user_.empty())
                user_ = login;
            return true;
        }
        catch (const TransportError& e)
        {
            if (attempt >= PROBE_ATTEMPTS)
                throw;
            log::debug("session probe failed (" + std::string(e.what()) + "), retrying");
        }
        catch (const UnauthenticatedError&)
        {
            return false;
        }
        catch (const ForbiddenError&)
        {
            return false;
        }
    }
}

void SessionManager::persist()
{
    try
    {
        CookieStore(settings_.cookie_file).save(settings_.wiki_url, user_, transport_.cookies(),
                                                now());
    }
    catch (const ConfigurationError& e)
    {
        log::warning(std::string("cannot save session: ") + e.what());
    }
}

void SessionManager::check_api_version()
{
    json version = call("core.getAPIVersion");
    if (!version.is_number_integer())
        throw RemoteProtocolError("core.getAPIVersion: unexpected response " + version.dump());

    api_version_ = version.get<int>();
    log::debug("API version " + std::to_string(api_version_));
    if (api_version_ < MIN_API_VERSION)
        throw ConfigurationError("DokuWiki API version " + std::to_string(api_version_) +
                                 " is too old; version " + std::to_string(MIN_API_VERSION) +
                                 " or newer is required");
}

} // namespace dokuwiki
