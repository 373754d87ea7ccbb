#ifndef tunnel_logging_hpp
#define tunnel_logging_hpp

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tunnel {
namespace log {

enum class Level : int {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

using Sink = std::function<void(Level, const char* file, int line, const std::string& message)>;

void setLevel(Level level);
Level level();
bool enabled(Level level);

// 传入空 sink 恢复为 stderr 输出
void setSink(Sink sink);

std::optional<Level> parseLevel(std::string_view name);
const char* levelName(Level level);

#if defined(__GNUC__)
__attribute__((format(printf, 4, 5)))
#endif
void write(Level level, const char* file, int line, const char* fmt, ...);

} // namespace log
} // namespace tunnel

#define TUN_LOG(lvl, ...)                                                      \
    do {                                                                       \
        if (::tunnel::log::enabled(lvl))                                       \
            ::tunnel::log::write(lvl, __FILE__, __LINE__, __VA_ARGS__);        \
    } while (0)

#define TUN_LOG_TRACE(...) TUN_LOG(::tunnel::log::Level::Trace, __VA_ARGS__)
#define TUN_LOG_DEBUG(...) TUN_LOG(::tunnel::log::Level::Debug, __VA_ARGS__)
#define TUN_LOG_INFO(...)  TUN_LOG(::tunnel::log::Level::Info, __VA_ARGS__)
#define TUN_LOG_WARN(...)  TUN_LOG(::tunnel::log::Level::Warn, __VA_ARGS__)
#define TUN_LOG_ERROR(...) TUN_LOG(::tunnel::log::Level::Error, __VA_ARGS__)

#endif // tunnel_logging_hpp
