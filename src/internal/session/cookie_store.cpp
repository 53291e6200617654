#include "cookie_store.hpp"

#include <dokuwiki/errors.hpp>
#include <dokuwiki/log.hpp>
#include <dokuwiki/types.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace dokuwiki
{

namespace
{
constexpr const char* HTTP_ONLY_PREFIX = "#HttpOnly_";
}

std::optional<NetscapeCookie> parse_cookie_line(const std::string& line)
{
    std::string text = line;
    NetscapeCookie cookie;
    if (text.compare(0, 10, HTTP_ONLY_PREFIX) == 0)
    {
        cookie.http_only = true;
        text = text.substr(10);
    }
    else if (text.empty() || text[0] == '#')
    {
        return std::nullopt;
    }

    std::vector<std::string> fields;
    std::stringstream stream(text);
    std::string field;
    while (std::getline(stream, field, '\t'))
        fields.push_back(field);
    // A cookie with an empty value has no trailing field
    if (fields.size() == 6)
        fields.emplace_back();
    if (fields.size() != 7)
        return std::nullopt;

    cookie.domain = fields[0];
    cookie.include_subdomains = fields[1] == "TRUE";
    cookie.path = fields[2];
    cookie.secure = fields[3] == "TRUE";
    try
    {
        cookie.expires = std::stoll(fields[4]);
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
    cookie.name = fields[5];
    cookie.value = fields[6];
    return cookie;
}

CookieStore::CookieStore(std::string path) : path_(std::move(path)) {}

std::optional<std::vector<std::string>> CookieStore::load(const std::string& wiki_url,
                                                          const std::string& user,
                                                          std::int64_t now) const
{
    std::error_code ec;
    if (path_.empty() || !fs::exists(path_, ec))
        return std::nullopt;

    json document;
    try
    {
        std::ifstream file(path_);
        if (!file)
        {
            log::warning("cannot open cookie file " + path_);
            return std::nullopt;
        }
        file >> document;
    }
    catch (const json::exception& e)
    {
        log::warning("ignoring unreadable cookie file " + path_ + ": " + e.what());
        return std::nullopt;
    }

    if (!document.is_object() || document.value("wiki", std::string()) != wiki_url)
    {
        log::debug("cookie file " + path_ + " belongs to another wiki");
        return std::nullopt;
    }

    const std::string stored_user = document.value("user", std::string());
    if (!user.empty() && !stored_user.empty() && stored_user != user)
    {
        log::debug("cookie file " + path_ + " belongs to user " + stored_user);
        return std::nullopt;
    }

    std::vector<std::string> lines;
    bool any_live = false;
    for (const auto& entry : document.value("cookies", json::array()))
    {
        if (!entry.is_string())
            continue;
        auto cookie = parse_cookie_line(entry.get<std::string>());
        if (!cookie)
            continue;
        if (cookie->expires == 0 || cookie->expires > now)
            any_live = true;
        lines.push_back(entry.get<std::string>());
    }

    if (!any_live)
    {
        log::debug("every cookie in " + path_ + " has expired");
        return std::nullopt;
    }
    return lines;
}

void CookieStore::save(const std::string& wiki_url, const std::string& user,
                       const std::vector<std::string>& cookies, std::int64_t now) const
{
    if (path_.empty())
        return;

    json document = {{"wiki", wiki_url}, {"user", user}, {"saved_at", now}, {"cookies", cookies}};

    fs::path target(path_);
    std::error_code ec;
    if (target.has_parent_path())
        fs::create_directories(target.parent_path(), ec);

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file)
            throw ConfigurationError("cannot write cookie file " + temp.string());
        file << document.dump(2) << std::endl;
        if (!file)
            throw ConfigurationError("cannot write cookie file " + temp.string());
    }
    fs::permissions(temp, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);

    fs::rename(temp, target, ec);
    if (ec)
        throw ConfigurationError("cannot replace cookie file " + path_ + ": " + ec.message());
}

void CookieStore::remove() const
{
    std::error_code ec;
    if (!path_.empty())
        fs::remove(path_, ec);
}

} // namespace dokuwiki
