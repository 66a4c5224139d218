#include <notchfill/util/dev_log.hpp>

#include <string>

namespace devlog {

static LogSinkState g_sinkState{nullptr, nullptr};

void SetLogSink(LogSinkFn sink, void *userData) {
    g_sinkState.sink = sink;
    g_sinkState.user_data = sink != nullptr ? userData : nullptr;
}

LogSinkState GetLogSink() {
    return g_sinkState;
}

std::string_view LevelName(Level level) {
    switch (level) {
    case level::trace: return "trace";
    case level::debug: return "debug";
    case level::info: return "info";
    case level::warn: return "warn";
    case level::error: return "error";
    default: return "?";
    }
}

namespace detail {

    void Emit(Level level, std::string_view group, std::string_view message) {
        if (g_sinkState.sink != nullptr) {
            const std::string line = fmt::format("[{}] {}", group, message);
            g_sinkState.sink(level, line.c_str(), g_sinkState.user_data);
            return;
        }
        fmt::print("{:<5} [{}] {}\n", LevelName(level), group, message);
    }

} // namespace detail

} // namespace devlog
