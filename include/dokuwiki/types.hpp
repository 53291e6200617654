#ifndef DOKUWIKI_TYPES_HPP
#define DOKUWIKI_TYPES_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace dokuwiki
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// Commit identity inside git's marks table
using Mark = std::uint64_t;

// A wiki object is either a page (wiki markup) or a media file (opaque bytes)
enum class EntryKind
{
    Page,
    Media
};

const char* entry_kind_name(EntryKind kind);

// ============================================================================
// Remote objects
// ============================================================================

/// Current state of a wiki page
struct PageInfo
{
    std::string id; // namespace-qualified, e.g. "wiki:syntax"
    std::int64_t revision = 0;
    std::int64_t last_modified = 0;
    std::string author;
    std::int64_t size = 0;
};

/// Current state of a media file
struct MediaInfo
{
    std::string id; // namespace-qualified file name, e.g. "wiki:logo.png"
    std::int64_t revision = 0;
    std::int64_t last_modified = 0;
    std::string author;
    std::int64_t size = 0;
    bool is_image = false;
};

/// DokuWiki changelog entry types
enum class ChangeType
{
    Create,    // 'C'
    Edit,      // 'E'
    MinorEdit, // 'e'
    Delete,    // 'D'
    Revert     // 'R'
};

// Unknown codes are treated as plain edits
ChangeType parse_change_type(const std::string& code);

/// One immutable revision of a page or media file.
/// DokuWiki revision ids are unix timestamps with second resolution, so
/// revision and timestamp normally carry the same value.
struct WikiRevision
{
    std::string id;
    EntryKind kind = EntryKind::Page;
    std::int64_t revision = 0;
    std::int64_t timestamp = 0;
    std::string author;
    std::string ip;
    std::string summary;
    ChangeType type = ChangeType::Edit;
    std::int64_t size_change = 0;

    bool is_delete() const
    {
        return type == ChangeType::Delete;
    }

    bool is_minor() const
    {
        return type == ChangeType::MinorEdit;
    }
};

} // namespace dokuwiki

#endif // DOKUWIKI_TYPES_HPP
