/**
 * git-remote-dokuwiki - git remote helper for DokuWiki
 *
 * git runs this program for remotes whose URL starts with "dokuwiki::":
 *
 *   git clone dokuwiki::wiki.example.com/ns mywiki
 *   git clone dokuwiki::https://example.com/wiki#ns mywiki
 *
 * Commands arrive on stdin and answers leave on stdout; diagnostics go to
 * stderr. See `git help remote-helpers` for the protocol.
 */

#include <csignal>
#include <dokuwiki/dokuwiki.hpp>
#include <exception>
#include <iostream>

using namespace dokuwiki;

namespace
{

void usage()
{
    std::cerr << "usage: git-remote-dokuwiki <remote> [<url>]\n"
                 "\n"
                 "This program is run by git for dokuwiki:: remotes.\n"
                 "Environment: DOKUWIKI_USER, DOKUWIKI_PASSWORD, DOKUWIKI_COOKIE_FILE,\n"
                 "             DOKUWIKI_DEPTH, DOKUWIKI_EXTENSION, DOKUWIKI_VERBOSE\n";
}

int serve(const std::string& remote_name, const std::string& url)
{
    const RemoteOptions options = resolve_options(remote_name, url, process_environment(),
                                                  git_configuration(), repository_dir());
    if (options.verbosity_floor)
        log::set_verbosity_floor(*options.verbosity_floor);

    log::debug(user_agent() + " serving " + options.remote_name + " (" +
               options.url.wiki_url + (options.url.wiki_namespace.empty()
                                           ? std::string()
                                           : " namespace " + options.url.wiki_namespace) +
               ")");
    prepare_state_dir(options);

    auto transport = create_curl_transport(options.url.wiki_url, options.timeout_seconds);
    auto credentials = create_git_credential_provider();

    SessionSettings settings;
    settings.wiki_url = options.url.wiki_url;
    settings.scheme = options.url.scheme;
    settings.host = options.url.host;
    settings.user = options.user;
    settings.password = options.password;
    settings.cookie_file = options.cookie_file;

    SessionManager session(*transport, settings, credentials.get());
    WikiClient client(session);

    IdentityMap identities(options.identity_file(), options.marks_file());
    identities.load();

    protocol::ProtocolSession helper(std::cin, std::cout, options, client, identities);
    return helper.run();
}

} // namespace

int main(int argc, char* argv[])
{
    // git may close our stdout early; report EPIPE instead of dying
    std::signal(SIGPIPE, SIG_IGN);

    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-V"))
    {
        std::cout << "git-remote-dokuwiki " << version_string() << std::endl;
        return protocol::EXIT_CLEAN;
    }
    if (argc < 2 || argc > 3 || std::string(argv[1]).empty())
    {
        usage();
        return protocol::EXIT_USAGE;
    }

    const std::string remote_name = argv[1];
    std::string url;
    try
    {
        if (argc == 3)
            url = argv[2];
        else if (auto configured = git_configuration()("remote." + remote_name + ".url"))
            url = *configured;
        else
            url = remote_name;

        return serve(remote_name, url);
    }
    catch (const WikiError& e)
    {
        log::error(e.what());
        return protocol::EXIT_FAILED;
    }
    catch (const std::exception& e)
    {
        log::error(std::string("fatal: ") + e.what());
        return protocol::EXIT_FAILED;
    }
}
