#include "git.hpp"

#include "../subprocess/process.hpp"

#include <cstdlib>
#include <dokuwiki/errors.hpp>
#include <dokuwiki/log.hpp>
#include <sstream>

namespace dokuwiki
{
namespace git
{

namespace
{
std::string trim_newlines(std::string text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
        text.pop_back();
    return text;
}

std::string first_line(const std::string& text)
{
    return text.substr(0, text.find('\n'));
}
} // namespace

GitResult run(const std::vector<std::string>& args, const std::string& input)
{
    subprocess::ProcessOptions options;
    options.redirect_stderr = true;

    subprocess::ProcessResult result;
    try
    {
        result = subprocess::run("git", args, input, options);
    }
    catch (const std::runtime_error& e)
    {
        throw ConfigurationError(std::string("cannot run git: ") + e.what());
    }
    if (result.exit_code == 127)
        throw ConfigurationError("cannot run git: not found in PATH");

    return GitResult{result.exit_code, std::move(result.out), std::move(result.err)};
}

std::string git_dir()
{
    if (const char* env = std::getenv("GIT_DIR"); env && env[0] != '\0')
        return env;

    GitResult result = run({"rev-parse", "--git-dir"});
    if (result.exit_code != 0)
        throw ConfigurationError("not inside a git repository: " +
                                 first_line(result.err));
    return trim_newlines(result.out);
}

std::optional<std::string> config_get(const std::string& key)
{
    GitResult result = run({"config", "--get", key});
    // 1 means the key is not set
    if (result.exit_code == 1)
        return std::nullopt;
    if (result.exit_code != 0)
        throw ConfigurationError("git config " + key + ": " + first_line(result.err));
    return trim_newlines(result.out);
}

std::string cat_blob(const std::string& object_id)
{
    GitResult result = run({"cat-file", "blob", object_id});
    if (result.exit_code != 0)
        throw StreamError("cannot read blob " + object_id + ": " + first_line(result.err));
    return std::move(result.out);
}

std::string format_credential(const Credential& credential)
{
    std::ostringstream out;
    if (!credential.protocol.empty())
        out << "protocol=" << credential.protocol << "\n";
    if (!credential.host.empty())
        out << "host=" << credential.host << "\n";
    if (!credential.path.empty())
        out << "path=" << credential.path << "\n";
    if (!credential.username.empty())
        out << "username=" << credential.username << "\n";
    if (!credential.password.empty())
        out << "password=" << credential.password << "\n";
    out << "\n";
    return out.str();
}

Credential parse_credential(const std::string& text)
{
    Credential credential;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        if (key == "protocol")
            credential.protocol = value;
        else if (key == "host")
            credential.host = value;
        else if (key == "path")
            credential.path = value;
        else if (key == "username")
            credential.username = value;
        else if (key == "password")
            credential.password = value;
    }
    return credential;
}

std::optional<Credential> GitCredentialProvider::fill(const Credential& request)
{
    GitResult result = run({"credential", "fill"}, format_credential(request));
    if (result.exit_code != 0)
    {
        log::debug("git credential fill failed: " + first_line(result.err));
        return std::nullopt;
    }

    Credential filled = parse_credential(result.out);
    if (filled.username.empty() || filled.password.empty())
        return std::nullopt;
    return filled;
}

void GitCredentialProvider::approve(const Credential& credential)
{
    GitResult result = run({"credential", "approve"}, format_credential(credential));
    if (result.exit_code != 0)
        log::warning("git credential approve failed: " + first_line(result.err));
}

void GitCredentialProvider::reject(const Credential& credential)
{
    GitResult result = run({"credential", "reject"}, format_credential(credential));
    if (result.exit_code != 0)
        log::warning("git credential reject failed: " + first_line(result.err));
}

} // namespace git

std::unique_ptr<CredentialProvider> create_git_credential_provider()
{
    return std::make_unique<git::GitCredentialProvider>();
}

} // namespace dokuwiki
