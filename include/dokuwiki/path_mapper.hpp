#ifndef DOKUWIKI_PATH_MAPPER_HPP
#define DOKUWIKI_PATH_MAPPER_HPP

#include <dokuwiki/types.hpp>
#include <map>
#include <optional>
#include <string>

namespace dokuwiki
{

// A wiki object as addressed by the repository
struct WikiObject
{
    EntryKind kind = EntryKind::Page;
    std::string id; // fully qualified wiki id
};

/**
 * Converts between wiki ids and repository paths.
 *
 * Ids are taken relative to the configured namespace: with namespace "ns",
 * page "ns:a:b" maps to "a/b.<ext>" and media "ns:img:logo.png" to
 * "img/logo.png". A path is media iff its extension is not exactly the page
 * extension.
 */
class PathMapper
{
  public:
    explicit PathMapper(std::string wiki_namespace, std::string extension = "txt");

    // nullopt when the id lies outside the configured namespace
    std::optional<std::string> page_path(const std::string& id) const;
    std::optional<std::string> media_path(const std::string& id) const;
    std::optional<std::string> path_for(EntryKind kind, const std::string& id) const;

    EntryKind classify(const std::string& path) const;

    /**
     * Wiki object for a repository path.
     * @throws StreamError for paths that cannot name a wiki object
     */
    WikiObject object_for(const std::string& path) const;

    bool in_scope(const std::string& id) const;

    const std::string& wiki_namespace() const
    {
        return namespace_;
    }

    const std::string& extension() const
    {
        return extension_;
    }

  private:
    std::optional<std::string> relative_id(const std::string& id) const;

    std::string namespace_;
    std::string extension_;
};

/**
 * Collision registry for one export session: registering a second wiki
 * identity under an already claimed path throws AmbiguousMappingError.
 */
class PathRegistry
{
  public:
    void claim(const std::string& path, const std::string& wiki_id);
    std::optional<std::string> owner(const std::string& path) const;

  private:
    std::map<std::string, std::string> owners_;
};

} // namespace dokuwiki

#endif // DOKUWIKI_PATH_MAPPER_HPP
