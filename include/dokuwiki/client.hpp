#ifndef DOKUWIKI_CLIENT_HPP
#define DOKUWIKI_CLIENT_HPP

#include <dokuwiki/session.hpp>
#include <dokuwiki/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dokuwiki
{

/**
 * Typed binding of the DokuWiki remote API (version 14+).
 *
 * Every call goes through the SessionManager. Read calls may be repeated
 * freely; put and delete calls mutate the wiki exactly once per invocation
 * and are never retried on transport failures.
 */
class WikiClient
{
  public:
    explicit WikiClient(SessionManager& session);

    // ------------------------------------------------------------------------
    // Enumeration
    // ------------------------------------------------------------------------

    std::vector<PageInfo> list_pages(const std::string& wiki_namespace);
    std::vector<MediaInfo> list_media(const std::string& wiki_namespace);

    // nullopt when the page or media file does not exist
    std::optional<PageInfo> page_info(const std::string& id);
    std::optional<MediaInfo> media_info(const std::string& id);

    // ------------------------------------------------------------------------
    // History
    // ------------------------------------------------------------------------

    /**
     * Full revision list, oldest first. Paged until the server returns no
     * unseen revision; the current revision is always included.
     */
    std::vector<WikiRevision> page_history(const std::string& id);
    std::vector<WikiRevision> media_history(const std::string& id);

    // Newest changelog entry (first history page only)
    std::optional<WikiRevision> last_change(EntryKind kind, const std::string& id);

    // Changes with a revision newer than or equal to since, oldest first
    std::vector<WikiRevision> recent_page_changes(std::int64_t since);
    std::vector<WikiRevision> recent_media_changes(std::int64_t since);

    // ------------------------------------------------------------------------
    // Content (revision 0 = current)
    // ------------------------------------------------------------------------

    std::string page_content(const std::string& id, std::int64_t revision = 0);
    std::string media_content(const std::string& id, std::int64_t revision = 0);

    // ------------------------------------------------------------------------
    // Mutation
    // ------------------------------------------------------------------------

    void put_page(const std::string& id, const std::string& text, const std::string& summary,
                  bool minor = false);

    // Empty text removes the page; the wiki records a delete revision
    void delete_page(const std::string& id, const std::string& summary);

    void put_media(const std::string& id, const std::string& data);
    void delete_media(const std::string& id);

    SessionManager& session()
    {
        return session_;
    }

  private:
    std::vector<WikiRevision> history(EntryKind kind, const std::string& id);
    std::vector<WikiRevision> recent_changes(EntryKind kind, std::int64_t since);

    SessionManager& session_;
};

} // namespace dokuwiki

#endif // DOKUWIKI_CLIENT_HPP
