#ifndef DOKUWIKI_INTERNAL_STREAM_FAST_IMPORT_WRITER_HPP
#define DOKUWIKI_INTERNAL_STREAM_FAST_IMPORT_WRITER_HPP

#include <cstdint>
#include <dokuwiki/types.hpp>
#include <optional>
#include <string>

namespace dokuwiki
{
namespace stream
{

struct Signature
{
    std::string name;
    std::string email;
    std::int64_t timestamp = 0;
};

// Quote a path C-style when git fast-import would misread it
std::string quote_path(const std::string& path);

// Builds a git fast-import stream in memory
class FastImportWriter
{
  public:
    void feature(const std::string& feature);
    void reset(const std::string& ref, std::optional<Mark> from = std::nullopt);

    void commit(const std::string& ref, Mark mark, const Signature& author,
                const std::string& message, std::optional<Mark> parent);
    void modify(const std::string& path, const std::string& content);
    void remove(const std::string& path);
    void end_commit();

    void progress(const std::string& message);
    void done();

    const std::string& str() const
    {
        return buffer_;
    }

    bool empty() const
    {
        return buffer_.empty();
    }

    void clear()
    {
        buffer_.clear();
    }

  private:
    void data(const std::string& bytes);

    std::string buffer_;
};

} // namespace stream
} // namespace dokuwiki

#endif // DOKUWIKI_INTERNAL_STREAM_FAST_IMPORT_WRITER_HPP
