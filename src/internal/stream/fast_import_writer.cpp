#include "fast_import_writer.hpp"

#include <cstdio>

namespace dokuwiki
{
namespace stream
{

std::string quote_path(const std::string& path)
{
    bool needs_quoting = !path.empty() && path.front() == '"';
    for (unsigned char c : path)
    {
        if (c == '\n' || c == '\\' || c == '"' || c < 0x20 || c == 0x7f)
            needs_quoting = true;
    }
    if (!needs_quoting)
        return path;

    std::string quoted = "\"";
    for (unsigned char c : path)
    {
        switch (c)
        {
        case '"':
            quoted += "\\\"";
            break;
        case '\\':
            quoted += "\\\\";
            break;
        case '\n':
            quoted += "\\n";
            break;
        case '\t':
            quoted += "\\t";
            break;
        default:
            if (c < 0x20 || c == 0x7f)
            {
                char octal[5];
                std::snprintf(octal, sizeof(octal), "\\%03o", c);
                quoted += octal;
            }
            else
            {
                quoted.push_back(static_cast<char>(c));
            }
        }
    }
    quoted += "\"";
    return quoted;
}

void FastImportWriter::feature(const std::string& feature)
{
    buffer_ += "feature " + feature + "\n";
}

void FastImportWriter::reset(const std::string& ref, std::optional<Mark> from)
{
    buffer_ += "reset " + ref + "\n";
    if (from)
        buffer_ += "from :" + std::to_string(*from) + "\n";
    buffer_ += "\n";
}

void FastImportWriter::commit(const std::string& ref, Mark mark, const Signature& author,
                              const std::string& message, std::optional<Mark> parent)
{
    const std::string ident = author.name + " <" + author.email + "> " +
                              std::to_string(author.timestamp) + " +0000";
    buffer_ += "commit " + ref + "\n";
    buffer_ += "mark :" + std::to_string(mark) + "\n";
    buffer_ += "author " + ident + "\n";
    buffer_ += "committer " + ident + "\n";
    data(message);
    if (parent)
        buffer_ += "from :" + std::to_string(*parent) + "\n";
}

void FastImportWriter::modify(const std::string& path, const std::string& content)
{
    buffer_ += "M 100644 inline " + quote_path(path) + "\n";
    data(content);
}

void FastImportWriter::remove(const std::string& path)
{
    buffer_ += "D " + quote_path(path) + "\n";
}

void FastImportWriter::end_commit()
{
    buffer_ += "\n";
}

void FastImportWriter::progress(const std::string& message)
{
    buffer_ += "progress " + message + "\n";
}

void FastImportWriter::done()
{
    buffer_ += "done\n";
}

void FastImportWriter::data(const std::string& bytes)
{
    buffer_ += "data " + std::to_string(bytes.size()) + "\n";
    buffer_ += bytes;
    buffer_ += "\n";
}

} // namespace stream
} // namespace dokuwiki
