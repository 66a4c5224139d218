#pragma once

/**
@file
@brief Development log facility.

Messages are grouped by compile-time log groups. A group is a struct with three static members:

```cpp
struct engine {
    static constexpr bool enabled = true;
    static constexpr devlog::Level level = devlog::level::debug;
    static constexpr std::string_view name = "Engine";
};
```

Messages below the group's level or from disabled groups compile to nothing.

All output goes through a single process-wide sink. The default sink prints to stdout.
*/

#include <fmt/format.h>

#include <string_view>
#include <utility>

namespace devlog {

using Level = int;

namespace level {
    inline constexpr Level trace = 1;
    inline constexpr Level debug = 2;
    inline constexpr Level info = 3;
    inline constexpr Level warn = 4;
    inline constexpr Level error = 5;
    inline constexpr Level off = 6;
} // namespace level

/// @brief Receives every formatted log message.
/// @param[in] level the message level
/// @param[in] message the formatted message, including the group name prefix
/// @param[in] userData the user pointer given to `SetLogSink`
using LogSinkFn = void (*)(Level level, const char *message, void *userData);

struct LogSinkState {
    LogSinkFn sink;
    void *user_data;
};

/// @brief Redirects all log output to the given sink. Passing `nullptr` restores the default stdout sink.
void SetLogSink(LogSinkFn sink, void *userData);

/// @brief Retrieves the current sink.
LogSinkState GetLogSink();

/// @brief Returns a short lowercase name for the level ("debug", "warn", ...).
std::string_view LevelName(Level level);

namespace detail {

    void Emit(Level level, std::string_view group, std::string_view message);

} // namespace detail

template <Level lv, typename TGroup, typename... TArgs>
inline void log(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    if constexpr (TGroup::enabled && lv >= TGroup::level) {
        detail::Emit(lv, TGroup::name, fmt::format(fmt, std::forward<TArgs>(args)...));
    }
}

template <typename TGroup, typename... TArgs>
inline void trace(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    log<level::trace, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <typename TGroup, typename... TArgs>
inline void debug(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    log<level::debug, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <typename TGroup, typename... TArgs>
inline void info(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    log<level::info, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <typename TGroup, typename... TArgs>
inline void warn(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    log<level::warn, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <typename TGroup, typename... TArgs>
inline void error(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    log<level::error, TGroup>(fmt, std::forward<TArgs>(args)...);
}

} // namespace devlog
