#ifndef DOKUWIKI_PUSH_IMPORTER_HPP
#define DOKUWIKI_PUSH_IMPORTER_HPP

#include <dokuwiki/client.hpp>
#include <dokuwiki/identity_map.hpp>
#include <dokuwiki/path_mapper.hpp>
#include <string>
#include <vector>

namespace dokuwiki
{

namespace stream
{
struct ExportStream;
struct ExportCommit;
} // namespace stream

struct PushSettings
{
    std::string branch_ref = "refs/heads/main"; // the only pushable ref
    bool strict = false;                        // reject on any unsynchronized change
    bool dry_run = false;
};

// Per-ref answer for the remote-helper protocol
struct RefStatus
{
    std::string ref;
    bool ok = false;
    std::string reason; // single line, git-facing
    size_t applied = 0; // commits fully applied
    size_t total = 0;
};

/**
 * Applies pushed commits to the wiki.
 *
 * Before anything is written, every touched path is checked against the
 * identity map: the wiki's current revision must be the last synchronized
 * one, otherwise the ref is rejected with "fetch first". Commits are then
 * applied in order; the first failing call stops the ref.
 */
class PushImporter
{
  public:
    PushImporter(WikiClient& client, IdentityMap& identities, const PathMapper& mapper);

    std::vector<RefStatus> push(const stream::ExportStream& input, const PushSettings& settings);

  private:
    RefStatus push_ref(const std::string& ref,
                       const std::vector<const stream::ExportCommit*>& commits,
                       const PushSettings& settings);

    // Throws ConflictError when the wiki moved since the last synchronization
    void check_concurrency(const std::vector<const stream::ExportCommit*>& commits,
                           const PushSettings& settings);

    std::int64_t current_revision(EntryKind kind, const std::string& id);

    // Apply one commit; returns the newest wiki revision it created
    std::int64_t apply(const stream::ExportCommit& commit, const PushSettings& settings);

    WikiClient& client_;
    IdentityMap& identities_;
    const PathMapper& mapper_;
};

} // namespace dokuwiki

#endif // DOKUWIKI_PUSH_IMPORTER_HPP
