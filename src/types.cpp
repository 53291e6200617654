#include <dokuwiki/types.hpp>

namespace dokuwiki
{

const char* entry_kind_name(EntryKind kind)
{
    return kind == EntryKind::Page ? "page" : "media";
}

ChangeType parse_change_type(const std::string& code)
{
    if (code == "C")
        return ChangeType::Create;
    if (code == "e")
        return ChangeType::MinorEdit;
    if (code == "D")
        return ChangeType::Delete;
    if (code == "R")
        return ChangeType::Revert;
    return ChangeType::Edit;
}

} // namespace dokuwiki
