#include "fast_export_parser.hpp"

#include <algorithm>
#include <dokuwiki/errors.hpp>
#include <dokuwiki/log.hpp>

namespace dokuwiki
{
namespace stream
{

namespace
{
bool starts_with(const std::string& text, const std::string& prefix)
{
    return text.compare(0, prefix.size(), prefix) == 0;
}

// Line reader with one line of push-back
class LineReader
{
  public:
    explicit LineReader(std::istream& in) : in_(in) {}

    bool next(std::string& line)
    {
        if (pending_)
        {
            line = std::move(*pending_);
            pending_.reset();
            return true;
        }
        if (!std::getline(in_, line))
            return false;
        ++line_number_;
        return true;
    }

    void unread(std::string line)
    {
        pending_ = std::move(line);
    }

    // Body of a `data <n>` command; the optional LF after it is consumed
    std::string data(const std::string& header)
    {
        if (!starts_with(header, "data "))
            throw error("expected data, got '" + header + "'");
        std::string count = header.substr(5);
        if (starts_with(count, "<<"))
            throw error("delimited data is not supported");

        size_t size;
        try
        {
            size = std::stoull(count);
        }
        catch (const std::exception&)
        {
            throw error("invalid data length '" + count + "'");
        }

        std::string bytes(size, '\0');
        if (size > 0 && !in_.read(&bytes[0], static_cast<std::streamsize>(size)))
            throw error("truncated data block (" + count + " bytes expected)");
        if (in_.peek() == '\n')
            in_.get();
        return bytes;
    }

    StreamError error(const std::string& message) const
    {
        return StreamError("fast-export stream, line " + std::to_string(line_number_) + ": " +
                           message);
    }

  private:
    std::istream& in_;
    std::optional<std::string> pending_;
    size_t line_number_ = 0;
};

std::optional<Mark> parse_mark(const std::string& text)
{
    if (text.size() < 2 || text[0] != ':')
        return std::nullopt;
    try
    {
        return static_cast<Mark>(std::stoull(text.substr(1)));
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

void note_ref(ExportStream& stream, const std::string& ref)
{
    if (std::find(stream.refs.begin(), stream.refs.end(), ref) == stream.refs.end())
        stream.refs.push_back(ref);
}

// Split "<field> <rest>" once
std::pair<std::string, std::string> split_once(const std::string& text)
{
    size_t space = text.find(' ');
    if (space == std::string::npos)
        return {text, std::string()};
    return {text.substr(0, space), text.substr(space + 1)};
}
} // namespace

std::string unquote_path(const std::string& text)
{
    if (text.size() < 2 || text.front() != '"' || text.back() != '"')
        return text;

    std::string out;
    for (size_t i = 1; i + 1 < text.size(); ++i)
    {
        char c = text[i];
        if (c != '\\' || i + 2 >= text.size())
        {
            out.push_back(c);
            continue;
        }
        char next = text[++i];
        switch (next)
        {
        case 'n':
            out.push_back('\n');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'a':
            out.push_back('\a');
            break;
        case 'b':
            out.push_back('\b');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 'v':
            out.push_back('\v');
            break;
        default:
            if (next >= '0' && next <= '7' && i + 2 < text.size())
            {
                int value = (next - '0') * 64 + (text[i + 1] - '0') * 8 + (text[i + 2] - '0');
                out.push_back(static_cast<char>(value));
                i += 2;
            }
            else
            {
                out.push_back(next);
            }
        }
    }
    return out;
}

ExportStream parse_fast_export(std::istream& in, const BlobResolver& resolve)
{
    ExportStream stream;
    std::map<Mark, std::string> blobs;
    LineReader reader(in);
    std::string line;

    auto resolve_blob = [&](const std::string& dataref) -> std::string
    {
        if (auto mark = parse_mark(dataref))
        {
            auto it = blobs.find(*mark);
            if (it != blobs.end())
                return it->second;
        }
        if (!resolve)
            throw reader.error("unknown blob " + dataref);
        return resolve(dataref);
    };

    while (reader.next(line))
    {
        if (line.empty() || starts_with(line, "feature ") || starts_with(line, "option ") ||
            starts_with(line, "progress ") || line == "checkpoint")
            continue;

        if (line == "done")
            return stream;

        if (line == "blob")
        {
            std::optional<Mark> mark;
            while (reader.next(line))
            {
                if (starts_with(line, "mark "))
                    mark = parse_mark(line.substr(5));
                else if (starts_with(line, "original-oid "))
                    continue;
                else
                    break;
            }
            std::string content = reader.data(line);
            if (mark)
                blobs[*mark] = std::move(content);
            continue;
        }

        if (starts_with(line, "reset "))
        {
            std::string ref = line.substr(6);
            std::string from;
            if (reader.next(line))
            {
                if (starts_with(line, "from "))
                    from = line.substr(5);
                else
                    reader.unread(line);
            }
            stream.resets[ref] = from;
            note_ref(stream, ref);
            continue;
        }

        if (starts_with(line, "tag "))
        {
            // Tags cannot be represented in the wiki; skip the whole block
            const std::string tag = line.substr(4);
            while (reader.next(line))
            {
                if (starts_with(line, "data "))
                {
                    reader.data(line);
                    break;
                }
            }
            log::warning("ignoring tag " + tag);
            continue;
        }

        if (!starts_with(line, "commit "))
            throw reader.error("unexpected command '" + line + "'");

        ExportCommit commit;
        commit.ref = line.substr(7);
        note_ref(stream, commit.ref);

        // Header up to and including the message
        for (;;)
        {
            if (!reader.next(line))
                throw reader.error("unexpected end of stream in commit header");
            if (starts_with(line, "mark "))
                commit.mark = parse_mark(line.substr(5));
            else if (starts_with(line, "original-oid "))
                commit.original_oid = line.substr(13);
            else if (starts_with(line, "author "))
                commit.author = line.substr(7);
            else if (starts_with(line, "committer "))
                commit.committer = line.substr(10);
            else if (starts_with(line, "encoding "))
                continue;
            else if (starts_with(line, "gpgsig "))
            {
                if (!reader.next(line))
                    throw reader.error("unexpected end of stream in signature");
                reader.data(line);
            }
            else if (starts_with(line, "data "))
            {
                commit.message = reader.data(line);
                break;
            }
            else
                throw reader.error("unexpected commit header '" + line + "'");
        }

        // Parents and file changes up to a blank line or the next command
        while (reader.next(line))
        {
            if (line.empty())
                break;
            if (starts_with(line, "from "))
                commit.from = line.substr(5);
            else if (starts_with(line, "merge "))
                commit.merges.push_back(line.substr(6));
            else if (starts_with(line, "M "))
            {
                auto [mode, rest] = split_once(line.substr(2));
                auto [dataref, path_text] = split_once(rest);
                if (mode == "160000")
                    throw reader.error("submodules cannot be pushed to a wiki");
                if (mode == "120000")
                    throw reader.error("symbolic links cannot be pushed to a wiki");
                if (mode != "100644" && mode != "100755" && mode != "644" && mode != "755")
                    throw reader.error("unsupported file mode " + mode);
                if (path_text.empty())
                    throw reader.error("missing path in '" + line + "'");

                FileChange change;
                change.op = FileChange::Op::Modify;
                change.path = unquote_path(path_text);
                if (dataref == "inline")
                {
                    if (!reader.next(line))
                        throw reader.error("missing inline data");
                    change.content = reader.data(line);
                }
                else
                {
                    change.content = resolve_blob(dataref);
                }
                commit.changes.push_back(std::move(change));
            }
            else if (starts_with(line, "D "))
            {
                FileChange change;
                change.op = FileChange::Op::Delete;
                change.path = unquote_path(line.substr(2));
                commit.changes.push_back(std::move(change));
            }
            else if (starts_with(line, "R ") || starts_with(line, "C ") ||
                     starts_with(line, "N ") || line == "deleteall")
            {
                throw reader.error("unsupported file command '" + split_once(line).first +
                                   "' (run fast-export without -M/-C)");
            }
            else
            {
                reader.unread(line);
                break;
            }
        }

        stream.commits.push_back(std::move(commit));
    }

    return stream;
}

} // namespace stream
} // namespace dokuwiki
