#ifndef DOKUWIKI_INTERNAL_STREAM_FAST_EXPORT_PARSER_HPP
#define DOKUWIKI_INTERNAL_STREAM_FAST_EXPORT_PARSER_HPP

#include <dokuwiki/types.hpp>
#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dokuwiki
{
namespace stream
{

struct FileChange
{
    enum class Op
    {
        Modify,
        Delete
    };

    Op op = Op::Modify;
    std::string path;
    std::string content; // Modify only
};

struct ExportCommit
{
    std::string ref;
    std::optional<Mark> mark;
    std::string original_oid;
    std::string author;
    std::string committer;
    std::string message;
    std::optional<std::string> from;
    std::vector<std::string> merges;
    std::vector<FileChange> changes;
};

struct ExportStream
{
    std::vector<ExportCommit> commits;
    std::map<std::string, std::string> resets; // ref -> from (may be empty)

    // Every ref the stream updates, in first-seen order
    std::vector<std::string> refs;
};

// Resolves a data reference (":<mark>" from an earlier run or a raw object
// id) to blob content
using BlobResolver = std::function<std::string(const std::string& dataref)>;

/**
 * Read a git fast-export stream up to and including `done` (or end of
 * input). Data blocks are read byte-exactly.
 * @throws StreamError on malformed or unsupported input
 */
ExportStream parse_fast_export(std::istream& in, const BlobResolver& resolve);

// Undo C-style quoting of a path
std::string unquote_path(const std::string& text);

} // namespace stream
} // namespace dokuwiki

#endif // DOKUWIKI_INTERNAL_STREAM_FAST_EXPORT_PARSER_HPP
