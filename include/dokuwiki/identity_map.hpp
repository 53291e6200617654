#ifndef DOKUWIKI_IDENTITY_MAP_HPP
#define DOKUWIKI_IDENTITY_MAP_HPP

#include <dokuwiki/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dokuwiki
{

// How a mapping came into existence
enum class Origin
{
    Fetch,  // wiki revision materialized as a commit
    Push,   // commit turned into a wiki revision
    Squash  // oldest retained revision of a depth-limited export
};

const char* origin_name(Origin origin);

/// (path, wiki revision) <-> commit mark
struct IdentityEntry
{
    std::string path;
    std::string wiki_id;
    EntryKind kind = EntryKind::Page;
    std::int64_t revision = 0;
    Mark mark = 0;
    Origin origin = Origin::Fetch;
    bool deleted = false;
};

/// Last synchronized commit of a ref
struct HeadRecord
{
    std::string ref;
    Mark mark = 0;
    std::int64_t timestamp = 0; // newest wiki revision covered
};

/**
 * Persistent, append-only map between wiki revisions and commits.
 *
 * Backed by a JSON-lines journal (identity.jsonl) next to git's marks table
 * (git.marks). Records are only ever appended; at load time records whose
 * mark git never confirmed are dropped and the journal is rewritten.
 */
class IdentityMap
{
  public:
    IdentityMap(std::string journal_file, std::string marks_file);

    // Read git.marks and the journal; a missing file means "nothing synchronized"
    void load();

    // Re-read git.marks after git updated it
    void reload_marks();

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    const IdentityEntry* find(const std::string& path, std::int64_t revision) const;

    // Entry with the highest revision for path
    const IdentityEntry* latest(const std::string& path) const;

    // Paths whose latest entry is not a deletion
    std::vector<std::string> live_paths() const;

    std::optional<HeadRecord> head(const std::string& ref) const;

    // Object id git recorded for a mark
    std::optional<std::string> object_id(Mark mark) const;

    // Mark git recorded for an object id
    std::optional<Mark> mark_of(const std::string& object_id) const;

    bool empty() const
    {
        return by_path_.empty();
    }

    size_t size() const
    {
        return entry_count_;
    }

    // ------------------------------------------------------------------------
    // Mutation (each call is durable when it returns)
    // ------------------------------------------------------------------------

    // Allocate a fresh mark above every mark known to the journal or git
    Mark allocate_mark();

    // Already mapped (path, revision) pairs are skipped; returns the number appended
    size_t append(const IdentityEntry& entry);
    size_t append(const std::vector<IdentityEntry>& entries);

    void set_head(const std::string& ref, Mark mark, std::int64_t timestamp);

    const std::string& journal_file() const
    {
        return journal_file_;
    }

    const std::string& marks_file() const
    {
        return marks_file_;
    }

  private:
    bool index(const IdentityEntry& entry);
    void write_records(const std::vector<std::string>& lines);
    void rewrite(const std::vector<std::string>& lines);

    std::string journal_file_;
    std::string marks_file_;

    std::map<std::string, std::map<std::int64_t, IdentityEntry>> by_path_;
    std::map<std::string, HeadRecord> heads_;
    std::map<Mark, std::string> git_marks_;
    std::map<std::string, Mark> object_marks_;
    size_t entry_count_ = 0;
    Mark next_mark_ = 1;
};

// Parse a git marks file (":<mark> <object id>" lines); missing file = empty
std::map<Mark, std::string> read_marks_file(const std::string& path);

} // namespace dokuwiki

#endif // DOKUWIKI_IDENTITY_MAP_HPP
