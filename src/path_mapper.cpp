#include <algorithm>
#include <dokuwiki/errors.hpp>
#include <dokuwiki/path_mapper.hpp>

namespace dokuwiki
{

namespace
{
std::string strip_colons(const std::string& text)
{
    size_t begin = text.find_first_not_of(':');
    if (begin == std::string::npos)
        return {};
    size_t end = text.find_last_not_of(':');
    return text.substr(begin, end - begin + 1);
}
} // namespace

PathMapper::PathMapper(std::string wiki_namespace, std::string extension)
    : namespace_(strip_colons(wiki_namespace)), extension_(std::move(extension))
{
    if (!extension_.empty() && extension_.front() == '.')
        extension_.erase(0, 1);
    if (extension_.empty())
        throw ConfigurationError("page extension must not be empty");
}

std::optional<std::string> PathMapper::relative_id(const std::string& id) const
{
    std::string bare = strip_colons(id);
    if (bare.empty())
        return std::nullopt;
    if (namespace_.empty())
        return bare;

    const std::string prefix = namespace_ + ":";
    if (bare.size() <= prefix.size() || bare.compare(0, prefix.size(), prefix) != 0)
        return std::nullopt;
    return bare.substr(prefix.size());
}

bool PathMapper::in_scope(const std::string& id) const
{
    return relative_id(id).has_value();
}

std::optional<std::string> PathMapper::page_path(const std::string& id) const
{
    auto relative = relative_id(id);
    if (!relative)
        return std::nullopt;
    std::string path = *relative;
    std::replace(path.begin(), path.end(), ':', '/');
    return path + "." + extension_;
}

std::optional<std::string> PathMapper::media_path(const std::string& id) const
{
    auto relative = relative_id(id);
    if (!relative)
        return std::nullopt;
    std::string path = *relative;
    std::replace(path.begin(), path.end(), ':', '/');
    return path;
}

std::optional<std::string> PathMapper::path_for(EntryKind kind, const std::string& id) const
{
    return kind == EntryKind::Page ? page_path(id) : media_path(id);
}

EntryKind PathMapper::classify(const std::string& path) const
{
    const std::string name = path.substr(path.rfind('/') + 1);
    const std::string suffix = "." + extension_;
    if (name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0)
        return EntryKind::Page;
    return EntryKind::Media;
}

WikiObject PathMapper::object_for(const std::string& path) const
{
    if (path.empty() || path.front() == '/' || path.back() == '/' ||
        path.find("//") != std::string::npos || path.find(':') != std::string::npos)
        throw StreamError("path '" + path + "' cannot be stored in the wiki");

    WikiObject object;
    object.kind = classify(path);

    std::string relative = path;
    if (object.kind == EntryKind::Page)
        relative.resize(relative.size() - extension_.size() - 1);
    std::replace(relative.begin(), relative.end(), '/', ':');

    object.id = namespace_.empty() ? relative : namespace_ + ":" + relative;
    return object;
}

void PathRegistry::claim(const std::string& path, const std::string& wiki_id)
{
    auto [it, inserted] = owners_.emplace(path, wiki_id);
    if (!inserted && it->second != wiki_id)
        throw AmbiguousMappingError(path, it->second, wiki_id);
}

std::optional<std::string> PathRegistry::owner(const std::string& path) const
{
    auto it = owners_.find(path);
    if (it == owners_.end())
        return std::nullopt;
    return it->second;
}

} // namespace dokuwiki
