#include "internal/stream/fast_import_writer.hpp"

#include <algorithm>
#include <dokuwiki/errors.hpp>
#include <dokuwiki/history_exporter.hpp>
#include <dokuwiki/log.hpp>
#include <map>
#include <set>

namespace dokuwiki
{

// One page or media file that may have revisions to export
struct HistoryExporter::Candidate
{
    EntryKind kind = EntryKind::Page;
    std::string id;
    std::string path;
    std::int64_t current = 0; // revision the listing reported, 0 if not listed
};

namespace
{
constexpr size_t PROGRESS_INTERVAL = 100;

struct PlannedRevision
{
    std::string path;
    std::int64_t current = 0;
    WikiRevision revision;
};

bool merge_order(const PlannedRevision& a, const PlannedRevision& b)
{
    if (a.revision.timestamp != b.revision.timestamp)
        return a.revision.timestamp < b.revision.timestamp;
    if (a.path != b.path)
        return a.path < b.path;
    return a.revision.revision < b.revision.revision;
}

// Identity fields must not contain the characters git uses as delimiters
std::string clean_ident(const std::string& text)
{
    std::string out;
    for (char c : text)
    {
        if (c == '<' || c == '>' || c == '\n' || c == '\r')
            continue;
        out.push_back(c);
    }
    size_t begin = out.find_first_not_of(' ');
    if (begin == std::string::npos)
        return {};
    size_t end = out.find_last_not_of(' ');
    return out.substr(begin, end - begin + 1);
}

stream::Signature signature_for(const WikiRevision& revision, const std::string& domain)
{
    std::string name = clean_ident(revision.author);
    if (name.empty())
        name = clean_ident(revision.ip);
    if (name.empty())
        name = "anonymous";

    std::string local = name;
    std::replace(local.begin(), local.end(), ' ', '.');
    return stream::Signature{name, local + "@" + domain, revision.timestamp};
}

std::string message_for(const WikiRevision& revision, bool first_for_path)
{
    if (!revision.summary.empty())
        return revision.summary;
    if (revision.is_delete())
        return "Delete " + revision.id;
    if (first_for_path || revision.type == ChangeType::Create)
        return "Create " + revision.id;
    return "Edit " + revision.id;
}
} // namespace

HistoryExporter::HistoryExporter(WikiClient& client, IdentityMap& identities,
                                 const PathMapper& mapper)
    : client_(client), identities_(identities), mapper_(mapper)
{
}

// ============================================================================
// Enumeration
// ============================================================================

std::vector<HistoryExporter::Candidate>
HistoryExporter::enumerate(const std::optional<HeadRecord>& head)
{
    PathRegistry registry;
    std::map<std::string, Candidate> by_path;

    auto add = [&](EntryKind kind, const std::string& id, std::int64_t current)
    {
        auto path = mapper_.path_for(kind, id);
        if (!path)
            return;
        const std::string identity = std::string(entry_kind_name(kind)) + " " + id;
        // A media file named like a page would come back as a page on push
        if (mapper_.classify(*path) != kind)
        {
            auto owner = registry.owner(*path);
            throw AmbiguousMappingError(*path, identity,
                                        owner ? *owner : std::string("the page it reads back as"));
        }
        registry.claim(*path, identity);

        auto& candidate = by_path[*path];
        candidate.kind = kind;
        candidate.id = id;
        candidate.path = *path;
        candidate.current = std::max(candidate.current, current);
    };

    log::notice("Fetching page list...");
    auto pages = client_.list_pages(mapper_.wiki_namespace());
    auto media = client_.list_media(mapper_.wiki_namespace());
    log::info("Found " + std::to_string(pages.size()) + " page(s) and " +
              std::to_string(media.size()) + " media file(s)");

    for (const auto& page : pages)
        add(EntryKind::Page, page.id, page.revision);
    for (const auto& file : media)
        add(EntryKind::Media, file.id, file.revision);

    std::set<std::string> listed;
    for (const auto& [path, candidate] : by_path)
        listed.insert(path);

    // Removed objects are no longer listed; find them through the changelog
    // and through mapped paths that disappeared from the listing.
    if (head)
    {
        auto changes = client_.recent_page_changes(head->timestamp);
        auto media_changes = client_.recent_media_changes(head->timestamp);
        changes.insert(changes.end(), media_changes.begin(), media_changes.end());

        for (const auto& change : changes)
        {
            auto path = mapper_.path_for(change.kind, change.id);
            if (!path || listed.count(*path) != 0)
                continue;
            add(change.kind, change.id, 0);
        }
    }

    for (const auto& path : identities_.live_paths())
    {
        if (listed.count(path) != 0 || by_path.count(path) != 0)
            continue;
        const IdentityEntry* entry = identities_.latest(path);
        if (entry && mapper_.in_scope(entry->wiki_id))
            add(entry->kind, entry->wiki_id, 0);
    }

    std::vector<Candidate> candidates;
    for (auto& [path, candidate] : by_path)
        candidates.push_back(std::move(candidate));
    return candidates;
}

// ============================================================================
// Export
// ============================================================================

ExportResult HistoryExporter::export_ref(const ExportSettings& settings)
{
    ExportResult result;
    const auto head = identities_.head(settings.head_key);
    if (head)
        result.newest_timestamp = head->timestamp;

    std::vector<PlannedRevision> planned;
    std::vector<PlannedRevision> bases;

    for (const auto& candidate : enumerate(head))
    {
        if (candidate.current != 0 && identities_.find(candidate.path, candidate.current))
            continue;

        log::info("Fetching history of " + candidate.id);
        std::vector<WikiRevision> history = candidate.kind == EntryKind::Page
                                                ? client_.page_history(candidate.id)
                                                : client_.media_history(candidate.id);

        const IdentityEntry* newest = identities_.latest(candidate.path);
        const std::int64_t floor = newest ? newest->revision : 0;

        std::vector<WikiRevision> fresh;
        for (auto& revision : history)
        {
            if (revision.revision <= floor || identities_.find(candidate.path, revision.revision))
                continue;
            revision.id = candidate.id;
            revision.kind = candidate.kind;
            if (revision.timestamp == 0)
                revision.timestamp = revision.revision;
            fresh.push_back(std::move(revision));
        }
        if (fresh.empty())
            continue;

        size_t first = 0;
        if (settings.depth && fresh.size() > static_cast<size_t>(*settings.depth))
        {
            first = fresh.size() - static_cast<size_t>(*settings.depth);
            log::info(candidate.id + ": keeping " + std::to_string(*settings.depth) + " of " +
                      std::to_string(fresh.size()) + " revisions");
            bases.push_back(PlannedRevision{candidate.path, candidate.current, fresh[first]});
            ++first;
        }
        for (size_t i = first; i < fresh.size(); ++i)
            planned.push_back(PlannedRevision{candidate.path, candidate.current, fresh[i]});
    }

    std::sort(bases.begin(), bases.end(), merge_order);
    std::sort(planned.begin(), planned.end(), merge_order);

    stream::FastImportWriter writer;
    std::optional<Mark> parent;
    if (head)
        parent = head->mark;

    const size_t total = planned.size() + bases.size();
    size_t processed = 0;

    auto fetch = [&](const PlannedRevision& item, std::string& content) -> bool
    {
        const WikiRevision& revision = item.revision;
        if (revision.is_delete())
            return true;
        // The current revision is read without a rev argument
        const std::int64_t rev = revision.revision == item.current ? 0 : revision.revision;
        try
        {
            content = revision.kind == EntryKind::Page ? client_.page_content(revision.id, rev)
                                                       : client_.media_content(revision.id, rev);
        }
        catch (const NotFoundError& e)
        {
            log::warning("skipping " + revision.id + " revision " +
                         std::to_string(revision.revision) + ": " + e.what());
            ++result.skipped;
            return false;
        }
        return true;
    };

    auto is_removal = [](const PlannedRevision& item, const std::string& content)
    { return item.revision.is_delete() || (item.revision.kind == EntryKind::Page && content.empty()); };

    auto begin_ref = [&]()
    {
        if (!parent && writer.empty())
            writer.reset(settings.target_ref);
    };

    auto tick = [&]()
    {
        ++processed;
        if (settings.progress && (processed % PROGRESS_INTERVAL == 0 || processed == total))
            writer.progress("Imported " + std::to_string(processed) + "/" +
                            std::to_string(total) + " revisions");
    };

    std::set<std::string> seen_paths;

    // Depth-limited files start from one squashed base commit
    if (!bases.empty())
    {
        std::vector<std::pair<const PlannedRevision*, std::string>> contents;
        WikiRevision stamp;
        for (const auto& base : bases)
        {
            std::string content;
            if (!fetch(base, content))
                continue;
            contents.emplace_back(&base, std::move(content));
            stamp.timestamp = std::max(stamp.timestamp, base.revision.timestamp);
        }

        if (!contents.empty())
        {
            const Mark mark = identities_.allocate_mark();
            std::string message = "Squashed history before depth " +
                                  std::to_string(*settings.depth) + "\n\n";
            for (const auto& [base, content] : contents)
                message += base->revision.id + " @ " + std::to_string(base->revision.revision) +
                           "\n";

            stamp.author = "dokuwiki";
            begin_ref();
            writer.commit(settings.target_ref, mark, signature_for(stamp, settings.email_domain),
                          message, parent);
            for (const auto& [base, content] : contents)
            {
                const bool removal = is_removal(*base, content);
                if (removal)
                    writer.remove(base->path);
                else
                    writer.modify(base->path, content);

                IdentityEntry entry;
                entry.path = base->path;
                entry.wiki_id = base->revision.id;
                entry.kind = base->revision.kind;
                entry.revision = base->revision.revision;
                entry.mark = mark;
                entry.origin = Origin::Squash;
                entry.deleted = removal;
                result.entries.push_back(entry);
                seen_paths.insert(base->path);
                tick();
            }
            writer.end_commit();

            parent = mark;
            ++result.commits;
            result.newest_timestamp = std::max(result.newest_timestamp, stamp.timestamp);
        }
    }

    for (const auto& item : planned)
    {
        const WikiRevision& revision = item.revision;
        std::string content;
        if (!fetch(item, content))
        {
            tick();
            continue;
        }

        const bool removal = is_removal(item, content);
        const bool first_for_path =
            seen_paths.count(item.path) == 0 && identities_.latest(item.path) == nullptr;
        const Mark mark = identities_.allocate_mark();

        begin_ref();
        writer.commit(settings.target_ref, mark, signature_for(revision, settings.email_domain),
                      message_for(revision, first_for_path), parent);
        if (removal)
            writer.remove(item.path);
        else
            writer.modify(item.path, content);
        writer.end_commit();

        IdentityEntry entry;
        entry.path = item.path;
        entry.wiki_id = revision.id;
        entry.kind = revision.kind;
        entry.revision = revision.revision;
        entry.mark = mark;
        entry.origin = Origin::Fetch;
        entry.deleted = removal;
        result.entries.push_back(entry);

        seen_paths.insert(item.path);
        parent = mark;
        ++result.commits;
        result.newest_timestamp = std::max(result.newest_timestamp, revision.timestamp);
        tick();
    }

    if (result.commits == 0 && head)
    {
        // Nothing new: keep the private ref at the synchronized head
        writer.reset(settings.target_ref, head->mark);
    }

    result.head = parent;
    result.stream = writer.str();

    if (result.commits > 0)
        log::notice("Imported " + std::to_string(result.commits) + " commit(s) into " +
                    settings.target_ref);
    else
        log::info(settings.target_ref + " is up to date");
    return result;
}

void HistoryExporter::record(const ExportSettings& settings, const ExportResult& result)
{
    identities_.append(result.entries);
    if (result.head && result.commits > 0)
        identities_.set_head(settings.head_key, *result.head, result.newest_timestamp);
}

} // namespace dokuwiki
