#ifndef DOKUWIKI_INTERNAL_GIT_GIT_HPP
#define DOKUWIKI_INTERNAL_GIT_GIT_HPP

#include <dokuwiki/credentials.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dokuwiki
{
namespace git
{

// Run git with args; throws ConfigurationError when git cannot be started.
// The exit status is returned, never thrown.
struct GitResult
{
    int exit_code = -1;
    std::string out;
    std::string err;
};

GitResult run(const std::vector<std::string>& args, const std::string& input = {});

// Repository metadata directory ($GIT_DIR as seen by the helper)
std::string git_dir();

// `git config --get <key>`; nullopt when unset
std::optional<std::string> config_get(const std::string& key);

// Contents of a blob by object id; throws StreamError when it does not exist
std::string cat_blob(const std::string& object_id);

// git credential key=value wire format
std::string format_credential(const Credential& credential);
Credential parse_credential(const std::string& text);

class GitCredentialProvider : public CredentialProvider
{
  public:
    std::optional<Credential> fill(const Credential& request) override;
    void approve(const Credential& credential) override;
    void reject(const Credential& credential) override;
};

} // namespace git
} // namespace dokuwiki

#endif // DOKUWIKI_INTERNAL_GIT_GIT_HPP
