#ifndef DOKUWIKI_INTERNAL_SESSION_COOKIE_STORE_HPP
#define DOKUWIKI_INTERNAL_SESSION_COOKIE_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dokuwiki
{

// One line of a Netscape cookie file as produced by libcurl
struct NetscapeCookie
{
    std::string domain;
    bool include_subdomains = false;
    std::string path;
    bool secure = false;
    std::int64_t expires = 0; // 0 = session cookie
    std::string name;
    std::string value;
    bool http_only = false;
};

std::optional<NetscapeCookie> parse_cookie_line(const std::string& line);

/**
 * Persisted wiki session: a JSON document
 * {"wiki": ..., "user": ..., "saved_at": ..., "cookies": [netscape lines]}.
 * The file is written atomically (temp file + rename) with owner-only
 * permissions.
 */
class CookieStore
{
  public:
    explicit CookieStore(std::string path);

    // Cookies stored for wiki_url/user, or nullopt when the file is absent,
    // unreadable, for another wiki or user, or holds only expired cookies.
    std::optional<std::vector<std::string>> load(const std::string& wiki_url,
                                                 const std::string& user,
                                                 std::int64_t now) const;

    void save(const std::string& wiki_url, const std::string& user,
              const std::vector<std::string>& cookies, std::int64_t now) const;

    void remove() const;

    const std::string& path() const
    {
        return path_;
    }

  private:
    std::string path_;
};

} // namespace dokuwiki

#endif // DOKUWIKI_INTERNAL_SESSION_COOKIE_STORE_HPP
