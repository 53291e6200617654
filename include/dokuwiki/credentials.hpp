#ifndef DOKUWIKI_CREDENTIALS_HPP
#define DOKUWIKI_CREDENTIALS_HPP

#include <memory>
#include <optional>
#include <string>

namespace dokuwiki
{

// One credential in git's credential-helper vocabulary
struct Credential
{
    std::string protocol;
    std::string host;
    std::string path;
    std::string username;
    std::string password;
};

/**
 * External credential source (interactive prompt or credential helper).
 *
 * fill() asks for a username/password for the given request and returns
 * nullopt when the user or helper supplied nothing. approve() and reject()
 * report the outcome so helpers can store or forget the credential.
 */
class CredentialProvider
{
  public:
    virtual ~CredentialProvider() = default;

    virtual std::optional<Credential> fill(const Credential& request) = 0;
    virtual void approve(const Credential& credential) = 0;
    virtual void reject(const Credential& credential) = 0;
};

// Provider backed by `git credential fill|approve|reject`
std::unique_ptr<CredentialProvider> create_git_credential_provider();

} // namespace dokuwiki

#endif // DOKUWIKI_CREDENTIALS_HPP
