#ifndef DOKUWIKI_HISTORY_EXPORTER_HPP
#define DOKUWIKI_HISTORY_EXPORTER_HPP

#include <dokuwiki/client.hpp>
#include <dokuwiki/identity_map.hpp>
#include <dokuwiki/path_mapper.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dokuwiki
{

struct ExportSettings
{
    std::string head_key;   // ref name the head is tracked under, e.g. refs/heads/main
    std::string target_ref; // ref the commits are written to
    std::optional<int> depth;
    bool progress = false;
    std::string email_domain = "dokuwiki";
};

// Outcome of exporting one ref; nothing is persisted until record() runs
struct ExportResult
{
    std::string stream;
    size_t commits = 0;
    size_t skipped = 0; // revisions whose content the wiki no longer has
    std::optional<Mark> head;
    std::int64_t newest_timestamp = 0;
    std::vector<IdentityEntry> entries;
};

/**
 * Turns the wiki's page and media history into a git fast-import stream.
 *
 * Revisions are ordered by (timestamp, path, revision) so that exporting the
 * same wiki state twice yields the same stream. Revisions already in the
 * identity map are never materialized again.
 */
class HistoryExporter
{
  public:
    HistoryExporter(WikiClient& client, IdentityMap& identities, const PathMapper& mapper);

    /**
     * Build the stream for one ref.
     * @throws WikiError (including AmbiguousMappingError) aborting this ref only
     */
    ExportResult export_ref(const ExportSettings& settings);

    // Persist the mappings and head of an export whose stream was delivered
    void record(const ExportSettings& settings, const ExportResult& result);

  private:
    struct Candidate;

    std::vector<Candidate> enumerate(const std::optional<HeadRecord>& head);

    WikiClient& client_;
    IdentityMap& identities_;
    const PathMapper& mapper_;
};

} // namespace dokuwiki

#endif // DOKUWIKI_HISTORY_EXPORTER_HPP
