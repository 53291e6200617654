#include "internal/git/git.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <dokuwiki/config.hpp>
#include <dokuwiki/errors.hpp>
#include <filesystem>
#include <fstream>
#include <limits>

namespace dokuwiki
{

namespace
{
constexpr const char* URL_PREFIX = "dokuwiki::";

bool starts_with(const std::string& text, const std::string& prefix)
{
    return text.compare(0, prefix.size(), prefix) == 0;
}

std::string trim(const std::string& text)
{
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return {};
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// "a/b/" or ":a:b" -> "a:b"
std::string to_namespace(const std::string& path)
{
    std::string ns = path;
    std::replace(ns.begin(), ns.end(), '/', ':');
    size_t begin = ns.find_first_not_of(':');
    if (begin == std::string::npos)
        return {};
    size_t end = ns.find_last_not_of(':');
    ns = ns.substr(begin, end - begin + 1);

    std::string collapsed;
    for (char c : ns)
    {
        if (c == ':' && !collapsed.empty() && collapsed.back() == ':')
            continue;
        collapsed.push_back(c);
    }
    return collapsed;
}

std::string host_without_port(const std::string& host)
{
    if (!host.empty() && host.front() == '[')
        return host.substr(0, host.find(']') + 1);
    return host.substr(0, host.find(':'));
}

void validate_host(const std::string& host, const std::string& url)
{
    if (host.empty())
        throw ConfigurationError("malformed remote URL '" + url + "': missing host");
    for (char c : host)
    {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '@' || c == '#' || c == '?')
            throw ConfigurationError("malformed remote URL '" + url + "': invalid host '" +
                                     host + "'");
    }
    size_t colon = host.rfind(':');
    if (colon != std::string::npos && host.front() != '[')
    {
        std::string port = host.substr(colon + 1);
        if (port.empty() || !std::all_of(port.begin(), port.end(),
                                         [](unsigned char c) { return std::isdigit(c); }))
            throw ConfigurationError("malformed remote URL '" + url + "': invalid port '" +
                                     port + "'");
    }
}

// Make a remote name usable as a path component and a ref component
std::string sanitize_component(const std::string& name)
{
    std::string out;
    for (char c : name)
    {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')
            out.push_back(c);
        else
            out.push_back('_');
    }
    if (out.empty() || out.front() == '.')
        out.insert(out.begin(), '_');
    return out;
}

std::optional<std::string> non_empty(const std::optional<std::string>& value)
{
    if (value && !value->empty())
        return value;
    return std::nullopt;
}
} // namespace

// ============================================================================
// URL parsing
// ============================================================================

RemoteUrl parse_remote_url(const std::string& input)
{
    std::string url = trim(input);
    if (starts_with(url, URL_PREFIX))
        url = url.substr(std::string(URL_PREFIX).size());
    if (url.empty())
        throw ConfigurationError("empty remote URL");

    RemoteUrl result;
    bool explicit_scheme = false;
    if (starts_with(url, "https://"))
    {
        result.scheme = "https";
        url = url.substr(8);
        explicit_scheme = true;
    }
    else if (starts_with(url, "http://"))
    {
        result.scheme = "http";
        url = url.substr(7);
        explicit_scheme = true;
    }
    else if (url.find("://") != std::string::npos)
    {
        throw ConfigurationError("unsupported URL scheme in '" + input + "'");
    }

    std::string fragment;
    if (size_t hash = url.find('#'); hash != std::string::npos)
    {
        fragment = url.substr(hash + 1);
        url = url.substr(0, hash);
        if (!explicit_scheme)
            throw ConfigurationError("malformed remote URL '" + input +
                                     "': '#namespace' requires an http(s):// URL");
    }

    size_t slash = url.find('/');
    std::string authority = url.substr(0, slash);
    std::string path = slash == std::string::npos ? std::string() : url.substr(slash);

    if (size_t at = authority.rfind('@'); at != std::string::npos)
    {
        result.user = authority.substr(0, at);
        authority = authority.substr(at + 1);
        if (result.user.empty())
            throw ConfigurationError("malformed remote URL '" + input + "': empty user name");
    }

    validate_host(authority, input);
    result.host = authority;

    if (explicit_scheme)
    {
        while (!path.empty() && path.back() == '/')
            path.pop_back();
        result.wiki_url = result.scheme + "://" + result.host + path;
        result.wiki_namespace = to_namespace(fragment);
    }
    else
    {
        std::string bare = host_without_port(result.host);
        result.scheme = (bare == "localhost" || bare == "127.0.0.1") ? "http" : "https";
        result.wiki_url = result.scheme + "://" + result.host;
        result.wiki_namespace = to_namespace(path);
    }
    return result;
}

// ============================================================================
// RemoteOptions
// ============================================================================

std::string RemoteOptions::marks_file() const
{
    return (std::filesystem::path(state_dir) / "git.marks").string();
}

std::string RemoteOptions::identity_file() const
{
    return (std::filesystem::path(state_dir) / "identity.jsonl").string();
}

std::string RemoteOptions::branch_ref() const
{
    return "refs/heads/" + branch;
}

std::string RemoteOptions::private_namespace() const
{
    return "refs/dokuwiki/" + sanitize_component(remote_name) + "/heads/";
}

std::string RemoteOptions::private_ref() const
{
    return private_namespace() + branch;
}

std::optional<long> parse_integer(const std::string& text)
{
    std::string value = trim(text);
    if (value.empty())
        return std::nullopt;
    size_t start = (value[0] == '-' || value[0] == '+') ? 1 : 0;
    if (start == value.size())
        return std::nullopt;
    for (size_t i = start; i < value.size(); ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(value[i])))
            return std::nullopt;
    }
    try
    {
        return std::stol(value);
    }
    catch (const std::out_of_range&)
    {
        return std::nullopt;
    }
}

std::optional<bool> parse_boolean(const std::string& text)
{
    std::string value = trim(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "yes" || value == "on" || value == "1")
        return true;
    if (value == "false" || value == "no" || value == "off" || value == "0" || value.empty())
        return false;
    return std::nullopt;
}

Lookup process_environment()
{
    return [](const std::string& key) -> std::optional<std::string>
    {
        const char* value = std::getenv(key.c_str());
        if (!value)
            return std::nullopt;
        return std::string(value);
    };
}

Lookup git_configuration()
{
    return [](const std::string& key) { return git::config_get(key); };
}

RemoteOptions resolve_options(const std::string& remote_name, const std::string& url,
                              const Lookup& env, const Lookup& git_config,
                              const std::string& git_dir)
{
    RemoteOptions options;
    options.remote_name = remote_name.empty() ? std::string("origin") : remote_name;
    options.url = parse_remote_url(url);

    // remote.<name>.dokuwiki<Key> overrides dokuwiki.<key>
    auto setting = [&](const std::string& env_key,
                       const std::string& key) -> std::optional<std::string>
    {
        if (!env_key.empty())
        {
            if (auto value = non_empty(env(env_key)))
                return value;
        }
        std::string camel = key;
        camel[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(camel[0])));
        if (auto value = git_config("remote." + options.remote_name + ".dokuwiki" + camel))
            return value;
        return git_config("dokuwiki." + key);
    };

    if (auto extension = setting("DOKUWIKI_EXTENSION", "extension"))
    {
        std::string ext = trim(*extension);
        if (!ext.empty() && ext.front() == '.')
            ext.erase(0, 1);
        if (ext.empty() || ext.find('/') != std::string::npos)
            throw ConfigurationError("invalid page extension '" + *extension + "'");
        options.extension = ext;
    }

    if (auto depth = setting("DOKUWIKI_DEPTH", "depth"))
    {
        auto value = parse_integer(*depth);
        if (!value || *value < 1 || *value > std::numeric_limits<int>::max())
            throw ConfigurationError("invalid depth '" + *depth + "': expected an integer >= 1");
        options.depth = static_cast<int>(*value);
    }

    if (auto branch = setting("", "branch"))
    {
        std::string value = trim(*branch);
        if (value.empty() || value.find_first_of(" ~^:?*[\\") != std::string::npos)
            throw ConfigurationError("invalid branch name '" + *branch + "'");
        options.branch = value;
    }

    if (auto strict = setting("", "strictPush"))
    {
        auto value = parse_boolean(*strict);
        if (!value)
            throw ConfigurationError("invalid boolean for strictPush: '" + *strict + "'");
        options.strict_push = *value;
    }

    if (auto timeout = setting("", "timeout"))
    {
        auto value = parse_integer(*timeout);
        if (!value || *value < 1)
            throw ConfigurationError("invalid timeout '" + *timeout + "': expected seconds >= 1");
        options.timeout_seconds = *value;
    }

    if (auto verbose = non_empty(env("DOKUWIKI_VERBOSE")))
    {
        auto value = parse_integer(*verbose);
        if (!value || *value < 0 || *value >= std::numeric_limits<int>::max())
            throw ConfigurationError("invalid DOKUWIKI_VERBOSE '" + *verbose + "'");
        options.verbosity_floor = static_cast<int>(*value) + 1;
    }

    if (auto user = non_empty(env("DOKUWIKI_USER")))
        options.user = *user;
    else
        options.user = options.url.user;

    if (auto password = non_empty(env("DOKUWIKI_PASSWORD")))
    {
        options.password = *password;
        if (options.user.empty())
            options.user = "admin";
    }

    options.state_dir = (std::filesystem::path(git_dir) / "dokuwiki" /
                         sanitize_component(options.remote_name))
                            .string();

    if (auto cookie_file = non_empty(env("DOKUWIKI_COOKIE_FILE")))
        options.cookie_file = *cookie_file;
    else
        options.cookie_file = (std::filesystem::path(options.state_dir) / "cookies.json").string();

    return options;
}

std::string repository_dir()
{
    return git::git_dir();
}

void prepare_state_dir(const RemoteOptions& options)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(options.state_dir, ec);
    if (ec)
        throw ConfigurationError("cannot create " + options.state_dir + ": " + ec.message());

    // git fast-export refuses --import-marks of a missing file
    const std::string marks = options.marks_file();
    if (!fs::exists(marks, ec))
    {
        std::ofstream touch(marks, std::ios::app);
        if (!touch)
            throw ConfigurationError("cannot create " + marks);
    }
}

} // namespace dokuwiki
