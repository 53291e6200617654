#ifndef DOKUWIKI_CONFIG_HPP
#define DOKUWIKI_CONFIG_HPP

#include <functional>
#include <optional>
#include <string>

namespace dokuwiki
{

// Result of parsing the URL git hands to the helper
struct RemoteUrl
{
    std::string wiki_url;       // e.g. "https://wiki.example.com/base"
    std::string host;           // host[:port], used for author emails and credentials
    std::string scheme;         // "https" or "http"
    std::string user;           // empty when not given
    std::string wiki_namespace; // e.g. "ns:sub", empty for the whole wiki
};

/**
 * Parse `[dokuwiki::][user@]host[:port][/ns/sub]` or
 * `http(s)://[user@]host[:port][/base][#ns:sub]`.
 * @throws ConfigurationError on malformed input
 */
RemoteUrl parse_remote_url(const std::string& url);

/// Immutable configuration the core components are built from
struct RemoteOptions
{
    std::string remote_name;
    RemoteUrl url;

    std::string user;
    std::optional<std::string> password; // explicit credential source

    std::string extension = "txt";
    std::optional<int> depth;
    std::string branch = "main";
    bool strict_push = false;
    long timeout_seconds = 60;

    std::string state_dir;   // <git-dir>/dokuwiki/<remote>
    std::string cookie_file; // persisted session
    std::optional<int> verbosity_floor;

    std::string marks_file() const;
    std::string identity_file() const;

    // refs/heads/<branch>
    std::string branch_ref() const;

    // refs/dokuwiki/<remote>/heads/<branch>
    std::string private_ref() const;
    std::string private_namespace() const;
};

// Lookup into an environment or configuration source; nullopt when unset
using Lookup = std::function<std::optional<std::string>(const std::string& key)>;

Lookup process_environment();
Lookup git_configuration();

/**
 * Resolve options from (highest precedence first) the environment, git
 * config (`remote.<name>.dokuwiki<Key>` before `dokuwiki.<key>`), the URL
 * and defaults.
 * @throws ConfigurationError for invalid values
 */
RemoteOptions resolve_options(const std::string& remote_name, const std::string& url,
                              const Lookup& env, const Lookup& git_config,
                              const std::string& git_dir);

// Metadata directory of the repository git runs the helper for
std::string repository_dir();

// Create the state directory and an empty marks file when missing
void prepare_state_dir(const RemoteOptions& options);

// Strict integer/boolean parsing shared with `option` handling
std::optional<long> parse_integer(const std::string& text);
std::optional<bool> parse_boolean(const std::string& text);

} // namespace dokuwiki

#endif // DOKUWIKI_CONFIG_HPP
