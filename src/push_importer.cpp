#include "internal/stream/fast_export_parser.hpp"

#include <algorithm>
#include <ctime>
#include <dokuwiki/errors.hpp>
#include <dokuwiki/log.hpp>
#include <dokuwiki/push_importer.hpp>
#include <set>

namespace dokuwiki
{

namespace
{
constexpr const char* NULL_OID = "0000000000000000000000000000000000000000";

std::string summary_of(const std::string& message)
{
    std::string line = message.substr(0, message.find('\n'));
    size_t begin = line.find_first_not_of(" \t\r");
    if (begin == std::string::npos)
        return {};
    size_t end = line.find_last_not_of(" \t\r");
    return line.substr(begin, end - begin + 1);
}

// git shows the reason verbatim; keep it on one line
std::string one_line(const std::string& text)
{
    std::string out = text;
    std::replace(out.begin(), out.end(), '\n', ' ');
    std::replace(out.begin(), out.end(), '\r', ' ');
    return out;
}

std::string describe(const stream::ExportCommit& commit)
{
    if (commit.mark)
        return ":" + std::to_string(*commit.mark);
    if (!commit.original_oid.empty())
        return commit.original_oid.substr(0, 12);
    return "(unmarked commit)";
}
} // namespace

PushImporter::PushImporter(WikiClient& client, IdentityMap& identities, const PathMapper& mapper)
    : client_(client), identities_(identities), mapper_(mapper)
{
}

std::vector<RefStatus> PushImporter::push(const stream::ExportStream& input,
                                          const PushSettings& settings)
{
    std::vector<RefStatus> statuses;
    for (const auto& ref : input.refs)
    {
        std::vector<const stream::ExportCommit*> commits;
        for (const auto& commit : input.commits)
        {
            if (commit.ref == ref)
                commits.push_back(&commit);
        }

        if (ref != settings.branch_ref)
        {
            statuses.push_back(RefStatus{ref, false,
                                         "only " + settings.branch_ref + " can be pushed to a wiki",
                                         0, commits.size()});
            continue;
        }

        auto reset = input.resets.find(ref);
        if (commits.empty() && reset != input.resets.end() && reset->second == NULL_OID)
        {
            statuses.push_back(
                RefStatus{ref, false, "deleting the wiki branch is not supported", 0, 0});
            continue;
        }

        statuses.push_back(push_ref(ref, commits, settings));
    }
    return statuses;
}

RefStatus PushImporter::push_ref(const std::string& ref,
                                 const std::vector<const stream::ExportCommit*>& commits,
                                 const PushSettings& settings)
{
    RefStatus status{ref, false, std::string(), 0, commits.size()};
    if (commits.empty())
    {
        status.ok = true;
        return status;
    }

    try
    {
        check_concurrency(commits, settings);
    }
    catch (const ConflictError& e)
    {
        log::error(std::string(e.what()));
        log::error("the wiki changed since the last fetch; run 'git pull' before pushing");
        status.reason = "fetch first";
        return status;
    }
    catch (const WikiError& e)
    {
        if (is_fatal(e.kind()))
            throw;
        status.reason = one_line(e.what());
        return status;
    }

    const auto head = identities_.head(ref);
    std::int64_t newest = head ? head->timestamp : 0;
    std::optional<Mark> last_applied;

    for (const auto* commit : commits)
    {
        try
        {
            newest = std::max(newest, apply(*commit, settings));
        }
        catch (const WikiError& e)
        {
            if (is_fatal(e.kind()))
                throw;
            status.reason = "pushed " + std::to_string(status.applied) + " of " +
                            std::to_string(status.total) + " commits; failed at " +
                            describe(*commit) + ": " + one_line(e.what());
            log::error(status.reason);
            if (last_applied && !settings.dry_run)
                identities_.set_head(ref, *last_applied, newest);
            return status;
        }

        ++status.applied;
        if (commit->mark)
            last_applied = commit->mark;
    }

    if (last_applied && !settings.dry_run)
        identities_.set_head(ref, *last_applied, newest);

    status.ok = true;
    log::notice(std::string(settings.dry_run ? "Would push " : "Pushed ") +
                std::to_string(status.applied) + " commit(s) to " + ref);
    return status;
}

// ============================================================================
// Optimistic concurrency
// ============================================================================

std::int64_t PushImporter::current_revision(EntryKind kind, const std::string& id)
{
    if (kind == EntryKind::Page)
    {
        auto info = client_.page_info(id);
        return info ? info->revision : 0;
    }
    auto info = client_.media_info(id);
    return info ? info->revision : 0;
}

void PushImporter::check_concurrency(const std::vector<const stream::ExportCommit*>& commits,
                                     const PushSettings& settings)
{
    std::set<std::string> touched;
    for (const auto* commit : commits)
    {
        for (const auto& change : commit->changes)
            touched.insert(change.path);
    }

    for (const auto& path : touched)
    {
        const WikiObject object = mapper_.object_for(path);
        const IdentityEntry* mapped = identities_.latest(path);
        const std::int64_t expected = (mapped && !mapped->deleted) ? mapped->revision : 0;
        const std::int64_t actual = current_revision(object.kind, object.id);

        log::debug("check " + object.id + ": synchronized " + std::to_string(expected) +
                   ", wiki " + std::to_string(actual));
        if (actual != expected)
            throw ConflictError("conflict on " + path + ": " + object.id + " is at revision " +
                                    std::to_string(actual) + " on the wiki, last fetched " +
                                    std::to_string(expected),
                                path);
    }

    if (!settings.strict)
        return;

    const auto head = identities_.head(settings.branch_ref);
    const std::int64_t since = head ? head->timestamp : 0;
    auto changes = client_.recent_page_changes(since);
    auto media_changes = client_.recent_media_changes(since);
    changes.insert(changes.end(), media_changes.begin(), media_changes.end());

    for (const auto& change : changes)
    {
        auto path = mapper_.path_for(change.kind, change.id);
        if (!path || identities_.find(*path, change.revision))
            continue;
        throw ConflictError("unsynchronized change to " + change.id + " at revision " +
                                std::to_string(change.revision),
                            *path);
    }
}

// ============================================================================
// Applying commits
// ============================================================================

std::int64_t PushImporter::apply(const stream::ExportCommit& commit,
                                 const PushSettings& settings)
{
    if (!commit.merges.empty())
        log::warning("flattening merge commit " + describe(commit) + " into a linear edit");
    log::debug("applying " + describe(commit) + " by " + commit.author);

    std::int64_t newest = 0;
    const std::string summary = summary_of(commit.message);

    for (const auto& change : commit.changes)
    {
        const WikiObject object = mapper_.object_for(change.path);
        const bool page = object.kind == EntryKind::Page;
        const bool removal = change.op == stream::FileChange::Op::Delete ||
                             (page && change.content.empty());
        const std::string edit_summary =
            !summary.empty() ? summary : (removal ? "Delete " : "Update ") + object.id;

        if (settings.dry_run)
        {
            log::notice(std::string("would ") + (removal ? "delete " : "update ") +
                        entry_kind_name(object.kind) + " " + object.id);
            continue;
        }

        log::info(std::string(removal ? "Deleting " : "Updating ") + entry_kind_name(object.kind) +
                  " " + object.id);
        if (page)
        {
            if (removal)
                client_.delete_page(object.id, edit_summary);
            else
                client_.put_page(object.id, change.content, edit_summary);
        }
        else if (removal)
        {
            try
            {
                client_.delete_media(object.id);
            }
            catch (const NotFoundError&)
            {
                log::info(object.id + " was already gone");
            }
        }
        else
        {
            client_.put_media(object.id, change.content);
        }

        if (!commit.mark)
        {
            log::debug("commit without mark; not recording " + object.id);
            continue;
        }

        IdentityEntry entry;
        entry.path = change.path;
        entry.wiki_id = object.id;
        entry.kind = object.kind;
        entry.mark = *commit.mark;
        entry.origin = Origin::Push;

        if (removal)
        {
            auto last = client_.last_change(object.kind, object.id);
            if (!last || !last->is_delete())
                continue;
            entry.revision = last->revision;
            entry.deleted = true;
        }
        else
        {
            entry.revision = current_revision(object.kind, object.id);
            if (entry.revision == 0)
                continue;
        }

        // Saving identical content creates no revision; keep the old mapping
        if (identities_.find(change.path, entry.revision))
            continue;
        identities_.append(entry);
        newest = std::max(newest, entry.revision);
    }
    return newest;
}

} // namespace dokuwiki
