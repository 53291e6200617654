#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <dokuwiki/identity_map.hpp>
#include <dokuwiki/log.hpp>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace dokuwiki
{

namespace
{
std::optional<Origin> parse_origin(const std::string& name)
{
    if (name == "fetch")
        return Origin::Fetch;
    if (name == "push")
        return Origin::Push;
    if (name == "squash")
        return Origin::Squash;
    return std::nullopt;
}

json entry_to_json(const IdentityEntry& entry)
{
    return {{"type", "revision"},
            {"path", entry.path},
            {"id", entry.wiki_id},
            {"kind", entry_kind_name(entry.kind)},
            {"revision", entry.revision},
            {"mark", entry.mark},
            {"origin", origin_name(entry.origin)},
            {"deleted", entry.deleted}};
}

IdentityEntry entry_from_json(const json& record)
{
    IdentityEntry entry;
    entry.path = record.at("path").get<std::string>();
    entry.wiki_id = record.at("id").get<std::string>();
    entry.kind = record.at("kind").get<std::string>() == "media" ? EntryKind::Media
                                                                  : EntryKind::Page;
    entry.revision = record.at("revision").get<std::int64_t>();
    entry.mark = record.at("mark").get<Mark>();
    auto origin = parse_origin(record.value("origin", std::string("fetch")));
    if (!origin)
        throw std::invalid_argument("unknown origin");
    entry.origin = *origin;
    entry.deleted = record.value("deleted", false);
    return entry;
}

json head_to_json(const HeadRecord& head)
{
    return {{"type", "head"}, {"ref", head.ref}, {"mark", head.mark}, {"timestamp", head.timestamp}};
}

void write_fully(int fd, const std::string& data, const std::string& path)
{
    size_t offset = 0;
    while (offset < data.size())
    {
        ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), "write " + path);
        }
        offset += static_cast<size_t>(n);
    }
}

void ensure_parent(const std::string& path)
{
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty())
        fs::create_directories(parent);
}
} // namespace

const char* origin_name(Origin origin)
{
    switch (origin)
    {
    case Origin::Fetch:
        return "fetch";
    case Origin::Push:
        return "push";
    case Origin::Squash:
        return "squash";
    }
    return "fetch";
}

std::map<Mark, std::string> read_marks_file(const std::string& path)
{
    std::map<Mark, std::string> marks;
    std::ifstream file(path);
    if (!file)
        return marks;

    std::string line;
    while (std::getline(file, line))
    {
        if (line.size() < 2 || line[0] != ':')
            continue;
        size_t space = line.find(' ');
        if (space == std::string::npos)
            continue;
        try
        {
            Mark mark = std::stoull(line.substr(1, space - 1));
            marks[mark] = line.substr(space + 1);
        }
        catch (const std::exception&)
        {
            log::warning("ignoring malformed line in " + path + ": " + line);
        }
    }
    return marks;
}

IdentityMap::IdentityMap(std::string journal_file, std::string marks_file)
    : journal_file_(std::move(journal_file)), marks_file_(std::move(marks_file))
{
}

// ============================================================================
// Loading
// ============================================================================

void IdentityMap::reload_marks()
{
    git_marks_ = read_marks_file(marks_file_);
    object_marks_.clear();
    for (const auto& [mark, oid] : git_marks_)
    {
        object_marks_[oid] = mark;
        next_mark_ = std::max(next_mark_, mark + 1);
    }
}

void IdentityMap::load()
{
    by_path_.clear();
    heads_.clear();
    entry_count_ = 0;
    next_mark_ = 1;
    reload_marks();

    std::ifstream file(journal_file_, std::ios::binary);
    if (!file)
        return;
    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string content = buffer.str();

    std::vector<std::string> kept;
    bool dirty = false;
    size_t dropped = 0;
    size_t start = 0;

    while (start < content.size())
    {
        size_t end = content.find('\n', start);
        if (end == std::string::npos)
        {
            log::warning("ignoring incomplete last record in " + journal_file_);
            dirty = true;
            break;
        }
        std::string line = content.substr(start, end - start);
        start = end + 1;
        if (line.empty())
            continue;

        json record;
        try
        {
            record = json::parse(line);
            const std::string type = record.at("type").get<std::string>();
            if (type == "revision")
            {
                IdentityEntry entry = entry_from_json(record);
                if (git_marks_.count(entry.mark) == 0)
                {
                    ++dropped;
                    dirty = true;
                    continue;
                }
                index(entry);
            }
            else if (type == "head")
            {
                HeadRecord head{record.at("ref").get<std::string>(), record.at("mark").get<Mark>(),
                                record.value("timestamp", std::int64_t{0})};
                if (git_marks_.count(head.mark) == 0)
                {
                    ++dropped;
                    dirty = true;
                    continue;
                }
                heads_[head.ref] = head;
            }
            else
            {
                throw std::invalid_argument("unknown record type " + type);
            }
        }
        catch (const std::exception& e)
        {
            log::warning("ignoring malformed record in " + journal_file_ + ": " + e.what());
            dirty = true;
            continue;
        }
        kept.push_back(line);
    }

    if (dropped > 0)
        log::info("discarding " + std::to_string(dropped) +
                  " unconfirmed record(s) from an interrupted fetch");
    if (dirty)
        rewrite(kept);
}

bool IdentityMap::index(const IdentityEntry& entry)
{
    auto& revisions = by_path_[entry.path];
    if (!revisions.emplace(entry.revision, entry).second)
        return false;
    ++entry_count_;
    next_mark_ = std::max(next_mark_, entry.mark + 1);
    return true;
}

// ============================================================================
// Queries
// ============================================================================

const IdentityEntry* IdentityMap::find(const std::string& path, std::int64_t revision) const
{
    auto it = by_path_.find(path);
    if (it == by_path_.end())
        return nullptr;
    auto rev = it->second.find(revision);
    return rev == it->second.end() ? nullptr : &rev->second;
}

const IdentityEntry* IdentityMap::latest(const std::string& path) const
{
    auto it = by_path_.find(path);
    if (it == by_path_.end() || it->second.empty())
        return nullptr;
    return &it->second.rbegin()->second;
}

std::vector<std::string> IdentityMap::live_paths() const
{
    std::vector<std::string> paths;
    for (const auto& [path, revisions] : by_path_)
    {
        if (!revisions.empty() && !revisions.rbegin()->second.deleted)
            paths.push_back(path);
    }
    return paths;
}

std::optional<HeadRecord> IdentityMap::head(const std::string& ref) const
{
    auto it = heads_.find(ref);
    if (it == heads_.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::string> IdentityMap::object_id(Mark mark) const
{
    auto it = git_marks_.find(mark);
    if (it == git_marks_.end())
        return std::nullopt;
    return it->second;
}

std::optional<Mark> IdentityMap::mark_of(const std::string& object_id) const
{
    auto it = object_marks_.find(object_id);
    if (it == object_marks_.end())
        return std::nullopt;
    return it->second;
}

// ============================================================================
// Mutation
// ============================================================================

Mark IdentityMap::allocate_mark()
{
    return next_mark_++;
}

size_t IdentityMap::append(const IdentityEntry& entry)
{
    return append(std::vector<IdentityEntry>{entry});
}

size_t IdentityMap::append(const std::vector<IdentityEntry>& entries)
{
    std::vector<std::string> lines;
    for (const auto& entry : entries)
    {
        if (index(entry))
            lines.push_back(entry_to_json(entry).dump());
    }
    write_records(lines);
    return lines.size();
}

void IdentityMap::set_head(const std::string& ref, Mark mark, std::int64_t timestamp)
{
    HeadRecord head{ref, mark, timestamp};
    write_records({head_to_json(head).dump()});
    heads_[ref] = head;
    next_mark_ = std::max(next_mark_, mark + 1);
}

void IdentityMap::write_records(const std::vector<std::string>& lines)
{
    if (lines.empty())
        return;

    ensure_parent(journal_file_);
    int fd = ::open(journal_file_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0)
        throw std::system_error(errno, std::generic_category(), "open " + journal_file_);

    try
    {
        for (const auto& line : lines)
            write_fully(fd, line + "\n", journal_file_);
        if (::fsync(fd) != 0)
            throw std::system_error(errno, std::generic_category(), "fsync " + journal_file_);
    }
    catch (...)
    {
        ::close(fd);
        throw;
    }
    ::close(fd);
}

void IdentityMap::rewrite(const std::vector<std::string>& lines)
{
    ensure_parent(journal_file_);
    const std::string temp = journal_file_ + ".tmp";
    int fd = ::open(temp.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0)
        throw std::system_error(errno, std::generic_category(), "open " + temp);

    std::string content;
    for (const auto& line : lines)
        content += line + "\n";

    try
    {
        write_fully(fd, content, temp);
        if (::fsync(fd) != 0)
            throw std::system_error(errno, std::generic_category(), "fsync " + temp);
    }
    catch (...)
    {
        ::close(fd);
        throw;
    }
    ::close(fd);

    if (std::rename(temp.c_str(), journal_file_.c_str()) != 0)
        throw std::system_error(errno, std::generic_category(), "rename " + temp);
}

} // namespace dokuwiki
