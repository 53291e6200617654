#ifndef DOKUWIKI_LOG_HPP
#define DOKUWIKI_LOG_HPP

#include <functional>
#include <string>

namespace dokuwiki
{
namespace log
{

// Levels follow git's verbosity convention: 0 = quiet, 1 = default,
// 2 = -v, 3 = -vv. Errors are always emitted.
enum class Level
{
    Error = 0,
    Warning = 1,
    Notice = 1,
    Info = 2,
    Debug = 3
};

/// Receives every emitted line, already prefixed ("warning: ", "DEBUG: ").
/// The default sink writes to stderr; stdout belongs to the helper protocol.
using Sink = std::function<void(Level level, const std::string& line)>;

void set_sink(Sink sink);
void reset_sink();

int verbosity();

// Set the level unconditionally (used by configuration)
void set_verbosity(int level);

// Apply a level requested by git; never lowers a floor set from the
// environment (DOKUWIKI_VERBOSE).
void request_verbosity(int level);
void set_verbosity_floor(int level);

bool enabled(Level level);

void error(const std::string& message);
void warning(const std::string& message);
void notice(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

} // namespace log
} // namespace dokuwiki

#endif // DOKUWIKI_LOG_HPP
