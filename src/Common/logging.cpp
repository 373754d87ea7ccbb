#include "logging.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <vector>

namespace tunnel {
namespace log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_sink_lock;
Sink g_sink;

const char* baseName(const char* path)
{
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // namespace

void setLevel(Level lvl)
{
    g_level.store(static_cast<int>(lvl));
}

Level level()
{
    return static_cast<Level>(g_level.load());
}

bool enabled(Level lvl)
{
    return lvl != Level::Off && static_cast<int>(lvl) >= g_level.load();
}

void setSink(Sink sink)
{
    std::lock_guard<std::mutex> g(g_sink_lock);
    g_sink = std::move(sink);
}

std::optional<Level> parseLevel(std::string_view name)
{
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info")  return Level::Info;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off")   return Level::Off;
    return std::nullopt;
}

const char* levelName(Level lvl)
{
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off:   return "OFF";
    }
    return "?";
}

void write(Level lvl, const char* file, int line, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    va_list copy;
    va_copy(copy, args);
    int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);

    std::string message;
    if (n > 0) {
        std::vector<char> buf(static_cast<size_t>(n) + 1);
        std::vsnprintf(buf.data(), buf.size(), fmt, args);
        message.assign(buf.data(), static_cast<size_t>(n));
    }
    va_end(args);

    std::lock_guard<std::mutex> g(g_sink_lock);
    if (g_sink) {
        g_sink(lvl, file, line, message);
        return;
    }
    std::fprintf(stderr, "%-5s %s:%d %s\n", levelName(lvl), baseName(file), line, message.c_str());
}

} // namespace log
} // namespace tunnel
