#pragma once
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

/**
 * @file Log.hpp
 * @brief Leveled printf-style logging to stderr for the series I/O library.
 *
 * @details
 * The level is taken from the `SERIESIO_LOG` environment variable
 * (`quiet|error|warn|info|debug`) the first time the library logs, so library users and tests
 * honour it without any setup. :cpp:func:`init` and :cpp:func:`set_level` override it; a config
 * file can name a level as well (see `log.level` in ConfigYAML.hpp).
 *
 * @rst
 * .. code-block:: cpp
 *
 *   seriesio::logx::init({seriesio::logx::Level::Debug});
 *   LOGI("wrote %zu variables to %s\n", n, path.c_str());
 * @endrst
 */

namespace seriesio::logx
{

enum class Level : int
{
    Quiet = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

struct Config
{
    Level level = Level::Info; // Info defers to SERIESIO_LOG
};

/// Case-insensitive level name, or nullopt for an unknown name.
inline std::optional<Level> parse_level(std::string_view name)
{
    std::string s(name);
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "quiet" || s == "off")
        return Level::Quiet;
    if (s == "error")
        return Level::Error;
    if (s == "warn" || s == "warning")
        return Level::Warn;
    if (s == "info")
        return Level::Info;
    if (s == "debug")
        return Level::Debug;
    return std::nullopt;
}

inline Level level_from_env()
{
    const char* v = std::getenv("SERIESIO_LOG");
    return v ? parse_level(v).value_or(Level::Info) : Level::Info;
}

namespace detail
{
    inline std::atomic<Level>& level_slot()
    {
        static std::atomic<Level> slot{level_from_env()};
        return slot;
    }
} // namespace detail

inline Level level()
{
    return detail::level_slot().load();
}

inline void set_level(Level L)
{
    detail::level_slot().store(L);
}

inline void init(const Config& cfg = {})
{
    set_level(cfg.level == Level::Info ? level_from_env() : cfg.level);
}

inline bool enabled(Level L)
{
    return L != Level::Quiet && L <= level();
}

inline const char* level_name(Level L)
{
    switch (L)
    {
    case Level::Quiet:
        return "quiet";
    case Level::Error:
        return "error";
    case Level::Warn:
        return "warn";
    case Level::Info:
        return "info";
    case Level::Debug:
        return "debug";
    }
    return "";
}

inline const char* level_tag(Level L)
{
    switch (L)
    {
    case Level::Error:
        return "[seriesio:error] ";
    case Level::Warn:
        return "[seriesio:warn ] ";
    case Level::Info:
        return "[seriesio:info ] ";
    case Level::Debug:
        return "[seriesio:debug] ";
    default:
        return "";
    }
}

inline void print(Level L, const char* fmt, ...)
{
    if (!enabled(L))
        return;
    va_list ap;
    va_start(ap, fmt);
    std::fputs(level_tag(L), stderr);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fflush(stderr);
}

#define LOGD(...) ::seriesio::logx::print(::seriesio::logx::Level::Debug, __VA_ARGS__)
#define LOGI(...) ::seriesio::logx::print(::seriesio::logx::Level::Info, __VA_ARGS__)
#define LOGW(...) ::seriesio::logx::print(::seriesio::logx::Level::Warn, __VA_ARGS__)
#define LOGE(...) ::seriesio::logx::print(::seriesio::logx::Level::Error, __VA_ARGS__)

} // namespace seriesio::logx
