#include <atomic>
#include <dokuwiki/log.hpp>
#include <iostream>
#include <mutex>

namespace dokuwiki
{
namespace log
{

namespace
{
std::atomic<int> current_level{1};
std::atomic<int> floor_level{0};

std::mutex sink_mutex;
Sink active_sink;

void emit(Level level, const std::string& line)
{
    std::lock_guard<std::mutex> lock(sink_mutex);
    if (active_sink)
    {
        active_sink(level, line);
        return;
    }
    std::cerr << line << std::endl;
}
} // namespace

void set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(sink_mutex);
    active_sink = std::move(sink);
}

void reset_sink()
{
    std::lock_guard<std::mutex> lock(sink_mutex);
    active_sink = nullptr;
}

int verbosity()
{
    return current_level.load();
}

void set_verbosity(int level)
{
    current_level.store(level);
}

void request_verbosity(int level)
{
    int floor = floor_level.load();
    current_level.store(level > floor ? level : floor);
}

void set_verbosity_floor(int level)
{
    floor_level.store(level);
    if (current_level.load() < level)
        current_level.store(level);
}

bool enabled(Level level)
{
    return static_cast<int>(level) <= current_level.load();
}

void error(const std::string& message)
{
    emit(Level::Error, "error: " + message);
}

void warning(const std::string& message)
{
    if (enabled(Level::Warning))
        emit(Level::Warning, "warning: " + message);
}

void notice(const std::string& message)
{
    if (enabled(Level::Notice))
        emit(Level::Notice, message);
}

void info(const std::string& message)
{
    if (enabled(Level::Info))
        emit(Level::Info, message);
}

void debug(const std::string& message)
{
    if (enabled(Level::Debug))
        emit(Level::Debug, "DEBUG: " + message);
}

} // namespace log
} // namespace dokuwiki
