#include "internal/encoding/base64.hpp"

#include <algorithm>
#include <dokuwiki/client.hpp>
#include <dokuwiki/errors.hpp>
#include <dokuwiki/log.hpp>
#include <set>

namespace dokuwiki
{

namespace
{
// Field names changed between API versions; the first present one wins.
std::int64_t int_field(const json& item, std::initializer_list<const char*> keys)
{
    for (const char* key : keys)
    {
        auto it = item.find(key);
        if (it == item.end() || it->is_null())
            continue;
        if (it->is_number())
            return it->get<std::int64_t>();
        if (it->is_string())
        {
            try
            {
                return std::stoll(it->get<std::string>());
            }
            catch (const std::exception&)
            {
                throw RemoteProtocolError(std::string("field '") + key + "' is not a number: " +
                                          it->dump());
            }
        }
        if (it->is_boolean())
            return it->get<bool>() ? 1 : 0;
    }
    return 0;
}

std::string string_field(const json& item, std::initializer_list<const char*> keys)
{
    for (const char* key : keys)
    {
        auto it = item.find(key);
        if (it != item.end() && it->is_string())
            return it->get<std::string>();
    }
    return {};
}

const json& expect_array(const json& result, const std::string& method)
{
    if (!result.is_array())
        throw RemoteProtocolError(method + ": expected an array, got " + result.dump());
    return result;
}

const json& expect_object(const json& result, const std::string& method)
{
    if (!result.is_object())
        throw RemoteProtocolError(method + ": expected an object, got " + result.dump());
    return result;
}

void expect_success(const json& result, const std::string& method, const std::string& id)
{
    if (result.is_boolean() && !result.get<bool>())
        throw RemoteProtocolError(method + ": wiki refused to save " + id);
}

WikiRevision parse_revision(const json& item, EntryKind kind, const std::string& id)
{
    WikiRevision revision;
    revision.kind = kind;
    revision.id = string_field(item, {"id", "name"});
    if (revision.id.empty())
        revision.id = id;
    revision.revision = int_field(item, {"revision", "rev", "version"});
    revision.timestamp = int_field(item, {"revision", "lastModified", "mtime"});
    revision.author = string_field(item, {"author", "user"});
    revision.ip = string_field(item, {"ip"});
    revision.summary = string_field(item, {"summary", "sum"});
    revision.type = parse_change_type(string_field(item, {"type"}));
    revision.size_change = int_field(item, {"sizechange", "sizeChange"});
    return revision;
}

bool oldest_first(const WikiRevision& a, const WikiRevision& b)
{
    return a.revision < b.revision;
}

PageInfo parse_page(const json& item)
{
    PageInfo page;
    page.id = string_field(item, {"id"});
    page.revision = int_field(item, {"revision", "rev"});
    page.last_modified = int_field(item, {"lastModified", "mtime", "revision", "rev"});
    page.author = string_field(item, {"author", "user"});
    page.size = int_field(item, {"size"});
    return page;
}

MediaInfo parse_media(const json& item)
{
    MediaInfo media;
    media.id = string_field(item, {"id"});
    media.revision = int_field(item, {"revision", "rev"});
    media.last_modified = int_field(item, {"lastModified", "mtime", "revision", "rev"});
    media.author = string_field(item, {"author", "user"});
    media.size = int_field(item, {"size"});
    media.is_image = int_field(item, {"isimage", "isImage"}) != 0;
    return media;
}

// Older servers answer an empty window with an error instead of []
bool is_empty_window(const WikiError& e)
{
    std::string text = e.what();
    return e.kind() == ErrorKind::RemoteProtocol && text.find("no changes") != std::string::npos;
}
} // namespace

WikiClient::WikiClient(SessionManager& session) : session_(session) {}

// ============================================================================
// Enumeration
// ============================================================================

std::vector<PageInfo> WikiClient::list_pages(const std::string& wiki_namespace)
{
    json result = session_.call("core.listPages", {{"namespace", wiki_namespace}, {"depth", 0}});

    std::vector<PageInfo> pages;
    for (const auto& item : expect_array(result, "core.listPages"))
    {
        PageInfo page = parse_page(item);
        if (!page.id.empty())
            pages.push_back(std::move(page));
    }
    return pages;
}

std::vector<MediaInfo> WikiClient::list_media(const std::string& wiki_namespace)
{
    json result = session_.call("core.listMedia", {{"namespace", wiki_namespace}, {"depth", 0}});

    std::vector<MediaInfo> media;
    for (const auto& item : expect_array(result, "core.listMedia"))
    {
        MediaInfo file = parse_media(item);
        if (!file.id.empty())
            media.push_back(std::move(file));
    }
    return media;
}

std::optional<PageInfo> WikiClient::page_info(const std::string& id)
{
    try
    {
        json result = session_.call("core.getPageInfo", {{"page", id}});
        PageInfo page = parse_page(expect_object(result, "core.getPageInfo"));
        if (page.id.empty())
            page.id = id;
        return page;
    }
    catch (const NotFoundError&)
    {
        return std::nullopt;
    }
}

std::optional<MediaInfo> WikiClient::media_info(const std::string& id)
{
    try
    {
        json result = session_.call("core.getMediaInfo", {{"media", id}});
        MediaInfo media = parse_media(expect_object(result, "core.getMediaInfo"));
        if (media.id.empty())
            media.id = id;
        return media;
    }
    catch (const NotFoundError&)
    {
        return std::nullopt;
    }
}

// ============================================================================
// History
// ============================================================================

std::vector<WikiRevision> WikiClient::page_history(const std::string& id)
{
    return history(EntryKind::Page, id);
}

std::vector<WikiRevision> WikiClient::media_history(const std::string& id)
{
    return history(EntryKind::Media, id);
}

std::vector<WikiRevision> WikiClient::history(EntryKind kind, const std::string& id)
{
    const bool page = kind == EntryKind::Page;
    const std::string method = page ? "core.getPageHistory" : "core.getMediaHistory";
    const std::string key = page ? "page" : "media";

    std::vector<WikiRevision> revisions;
    std::set<std::int64_t> seen;
    std::int64_t first = 0;

    for (;;)
    {
        json batch;
        try
        {
            batch = session_.call(method, {{key, id}, {"first", first}});
        }
        catch (const NotFoundError&)
        {
            break;
        }

        expect_array(batch, method);
        if (batch.empty())
            break;

        size_t fresh = 0;
        for (const auto& item : batch)
        {
            WikiRevision revision = parse_revision(item, kind, id);
            if (revision.revision == 0 || !seen.insert(revision.revision).second)
                continue;
            revisions.push_back(std::move(revision));
            ++fresh;
        }
        if (fresh == 0)
            break;
        first += static_cast<std::int64_t>(batch.size());
    }

    // The server may omit the current revision from the history listing
    std::int64_t current = 0;
    std::string author;
    if (page)
    {
        if (auto info = page_info(id))
        {
            current = info->revision;
            author = info->author;
        }
    }
    else if (auto info = media_info(id))
    {
        current = info->revision;
        author = info->author;
    }

    if (current != 0 && seen.count(current) == 0)
    {
        WikiRevision revision;
        revision.id = id;
        revision.kind = kind;
        revision.revision = current;
        revision.timestamp = current;
        revision.author = author;
        revision.type = revisions.empty() ? ChangeType::Create : ChangeType::Edit;
        revisions.push_back(std::move(revision));
    }

    std::sort(revisions.begin(), revisions.end(), oldest_first);
    log::debug(std::string(entry_kind_name(kind)) + " " + id + ": " +
               std::to_string(revisions.size()) + " revision(s)");
    return revisions;
}

std::optional<WikiRevision> WikiClient::last_change(EntryKind kind, const std::string& id)
{
    const bool page = kind == EntryKind::Page;
    const std::string method = page ? "core.getPageHistory" : "core.getMediaHistory";

    json batch;
    try
    {
        batch = session_.call(method, {{page ? "page" : "media", id}, {"first", 0}});
    }
    catch (const NotFoundError&)
    {
        return std::nullopt;
    }

    std::optional<WikiRevision> newest;
    for (const auto& item : expect_array(batch, method))
    {
        WikiRevision revision = parse_revision(item, kind, id);
        if (!newest || revision.revision > newest->revision)
            newest = std::move(revision);
    }
    return newest;
}

std::vector<WikiRevision> WikiClient::recent_page_changes(std::int64_t since)
{
    return recent_changes(EntryKind::Page, since);
}

std::vector<WikiRevision> WikiClient::recent_media_changes(std::int64_t since)
{
    return recent_changes(EntryKind::Media, since);
}

std::vector<WikiRevision> WikiClient::recent_changes(EntryKind kind, std::int64_t since)
{
    const std::string method =
        kind == EntryKind::Page ? "core.getRecentPageChanges" : "core.getRecentMediaChanges";

    json result;
    try
    {
        result = session_.call(method, {{"timestamp", since}});
    }
    catch (const WikiError& e)
    {
        if (!is_empty_window(e))
            throw;
        return {};
    }

    std::vector<WikiRevision> changes;
    for (const auto& item : expect_array(result, method))
    {
        WikiRevision change = parse_revision(item, kind, std::string());
        if (!change.id.empty() && change.revision >= since)
            changes.push_back(std::move(change));
    }
    std::stable_sort(changes.begin(), changes.end(), oldest_first);
    return changes;
}

// ============================================================================
// Content
// ============================================================================

std::string WikiClient::page_content(const std::string& id, std::int64_t revision)
{
    json params = {{"page", id}};
    if (revision != 0)
        params["rev"] = revision;

    json result = session_.call("core.getPage", params);
    if (!result.is_string())
        throw RemoteProtocolError("core.getPage: expected a string for " + id);
    return result.get<std::string>();
}

std::string WikiClient::media_content(const std::string& id, std::int64_t revision)
{
    json params = {{"media", id}};
    if (revision != 0)
        params["rev"] = revision;

    json result = session_.call("core.getMedia", params);
    if (!result.is_string())
        throw RemoteProtocolError("core.getMedia: expected a base64 string for " + id);
    return encoding::base64_decode(result.get<std::string>());
}

// ============================================================================
// Mutation
// ============================================================================

void WikiClient::put_page(const std::string& id, const std::string& text,
                          const std::string& summary, bool minor)
{
    json result = session_.call(
        "core.savePage", {{"page", id}, {"text", text}, {"summary", summary}, {"isminor", minor}});
    expect_success(result, "core.savePage", id);
}

void WikiClient::delete_page(const std::string& id, const std::string& summary)
{
    put_page(id, std::string(), summary);
}

void WikiClient::put_media(const std::string& id, const std::string& data)
{
    json result = session_.call(
        "core.saveMedia",
        {{"media", id}, {"base64", encoding::base64_encode(data)}, {"overwrite", true}});
    expect_success(result, "core.saveMedia", id);
}

void WikiClient::delete_media(const std::string& id)
{
    json result = session_.call("core.deleteMedia", {{"media", id}});
    expect_success(result, "core.deleteMedia", id);
}

} // namespace dokuwiki
