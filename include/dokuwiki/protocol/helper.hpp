#ifndef DOKUWIKI_PROTOCOL_HELPER_HPP
#define DOKUWIKI_PROTOCOL_HELPER_HPP

#include <dokuwiki/client.hpp>
#include <dokuwiki/config.hpp>
#include <dokuwiki/identity_map.hpp>
#include <dokuwiki/path_mapper.hpp>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace dokuwiki
{
namespace protocol
{

// Exit statuses of the helper process
constexpr int EXIT_CLEAN = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 128;

// Settings changed through `option` for the rest of the session
struct SessionOptions
{
    std::optional<int> depth;
    bool progress = false;
    bool dry_run = false;
    bool cloning = false;
};

/**
 * The git remote-helper command loop.
 *
 * Reads one command at a time from `in` and answers on `out`:
 * capabilities, list [for-push], option, import batches and export.
 * Every diagnostic goes through dokuwiki::log; `out` only ever carries
 * protocol text.
 */
class ProtocolSession
{
  public:
    // Resolves fast-export data references (":<mark>" or object ids) to blob content
    using BlobResolver = std::function<std::string(const std::string& dataref)>;

    ProtocolSession(std::istream& in, std::ostream& out, const RemoteOptions& options,
                    WikiClient& client, IdentityMap& identities, BlobResolver resolve = {});

    // No copy
    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    /**
     * Serve commands until a blank line or end of input.
     * @return EXIT_CLEAN, or EXIT_FAILED when a fetch failed or a
     *         process-fatal error ended the session
     */
    int run();

    const SessionOptions& options() const
    {
        return session_options_;
    }

    bool fetch_failed() const
    {
        return fetch_failed_;
    }

  private:
    void capabilities();
    void list(bool for_push);
    void option(const std::string& name, const std::string& value);
    void import_batch(const std::string& first_ref);
    void export_stream();

    std::string resolve_blob(const std::string& dataref) const;
    bool wiki_is_empty();
    void reply(const std::string& line);
    void end_reply();

    std::istream& in_;
    std::ostream& out_;
    const RemoteOptions& options_;
    WikiClient& client_;
    IdentityMap& identities_;
    PathMapper mapper_;
    BlobResolver resolve_;

    SessionOptions session_options_;
    bool fetch_failed_ = false;
};

} // namespace protocol
} // namespace dokuwiki

#endif // DOKUWIKI_PROTOCOL_HELPER_HPP
