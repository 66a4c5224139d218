#include <notchfill/notchfill_c.h>

#include <notchfill/core/configuration.hpp>
#include <notchfill/host/host.hpp>
#include <notchfill/notch/height_engine.hpp>
#include <notchfill/util/dev_log.hpp>

#include <fmt/format.h>

#include <cmath>
#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

using namespace notchfill;

namespace {

// Host backed by plain tables, for C callers that manage their own windows
class TableHost final : public host::Host {
public:
    bool IsGraphical() const override {
        return true;
    }

    bool IsNativeFullScreenEnabled() const override {
        return nativeFullScreen;
    }

    bool IsInTabStripPipeline(std::string_view marker) const override {
        return markerEnabled && marker == notch::kMarkerName;
    }

    void CreateStyle(const notch::StyleHandle &handle) override {
        styleHeights[handle.id] = 1.0;
    }

    double GetStyleHeight(const notch::StyleHandle &handle) const override {
        auto it = styleHeights.find(handle.id);
        return it != styleHeights.end() ? it->second : 1.0;
    }

    void SetStyleHeight(const notch::StyleHandle &handle, double height) override {
        styleHeights[handle.id] = height;
        styleChanged = true;
    }

    notch::ResizeChannel &GetResizeChannel() override {
        return resizeChannel;
    }

    bool nativeFullScreen = false;
    bool markerEnabled = true;
    bool styleChanged = false;
    std::unordered_map<uint64, double> styleHeights;
    std::unordered_map<uint64, notch::StyleHandle> windowStyles; // window ID -> style
    notch::ResizeChannel resizeChannel;
};

host::FullScreenState ToFullScreenState(uint32_t state) {
    switch (state) {
    case NOTCHFILL_FULLSCREEN_MAXIMIZED: return host::FullScreenState::Maximized;
    case NOTCHFILL_FULLSCREEN_FULLBOTH: return host::FullScreenState::FullBoth;
    case NOTCHFILL_FULLSCREEN_FULLWIDTH: return host::FullScreenState::FullWidth;
    case NOTCHFILL_FULLSCREEN_FULLHEIGHT: return host::FullScreenState::FullHeight;
    default: return host::FullScreenState::None;
    }
}

// Window view over a caller-provided state snapshot.
// Without a style table the window is read-only and never has a style attached.
class StateWindow final : public host::Window {
public:
    StateWindow(const notchfill_window_state_t &state, std::unordered_map<uint64, notch::StyleHandle> *windowStyles)
        : m_state(state)
        , m_windowStyles(windowStyles) {}

    uint64 GetID() const override {
        return m_state.window_id;
    }

    uint32 GetPixelWidth() const override {
        return m_state.pixel_width;
    }

    uint32 GetPixelHeight() const override {
        return m_state.pixel_height;
    }

    uint32 GetCharHeight() const override {
        return m_state.char_height;
    }

    host::FullScreenState GetFullScreenState() const override {
        return ToFullScreenState(m_state.fullscreen);
    }

    std::optional<notch::StyleHandle> GetStyleHandle() const override {
        if (m_windowStyles == nullptr) {
            return std::nullopt;
        }
        auto it = m_windowStyles->find(m_state.window_id);
        if (it == m_windowStyles->end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void SetStyleHandle(const notch::StyleHandle &handle) override {
        if (m_windowStyles != nullptr) {
            (*m_windowStyles)[m_state.window_id] = handle;
        }
    }

private:
    const notchfill_window_state_t &m_state;
    std::unordered_map<uint64, notch::StyleHandle> *m_windowStyles;
};

} // namespace

struct notchfill_handle {
    core::Configuration config;
    TableHost host;
    notch::HeightEngine engine{host, config};
    notchfill_log_callback_t log_callback = nullptr;
    void *log_user_data = nullptr;
    std::string last_error;
    bool detached = false;
};

namespace {

notchfill_log_level_t ToLogLevel(devlog::Level level) {
    switch (level) {
    case devlog::level::trace: return NOTCHFILL_LOG_LEVEL_TRACE;
    case devlog::level::debug: return NOTCHFILL_LOG_LEVEL_DEBUG;
    case devlog::level::info: return NOTCHFILL_LOG_LEVEL_INFO;
    case devlog::level::warn: return NOTCHFILL_LOG_LEVEL_WARN;
    case devlog::level::error: return NOTCHFILL_LOG_LEVEL_ERROR;
    default: return NOTCHFILL_LOG_LEVEL_INFO;
    }
}

void DevLogSink(devlog::Level level, const char *message, void *user_data) {
    auto *handle = static_cast<notchfill_handle *>(user_data);
    if (handle == nullptr || handle->log_callback == nullptr) {
        return;
    }
    handle->log_callback(handle->log_user_data, ToLogLevel(level), message);
}

notchfill_result_t SetLastError(notchfill_handle *handle, notchfill_result_t result, std::string message) {
    handle->last_error = std::move(message);
    if (handle->log_callback != nullptr) {
        handle->log_callback(handle->log_user_data, NOTCHFILL_LOG_LEVEL_ERROR, handle->last_error.c_str());
    }
    return result;
}

// Detachment is the expected outcome of disabling the marker, so it is reported once and not as an error
notchfill_result_t SetDetached(notchfill_handle *handle) {
    handle->last_error = "Marker was removed from the tab strip";
    if (!handle->detached) {
        handle->detached = true;
        if (handle->log_callback != nullptr) {
            handle->log_callback(handle->log_user_data, NOTCHFILL_LOG_LEVEL_INFO, handle->last_error.c_str());
        }
    }
    return NOTCHFILL_RESULT_DETACHED;
}

void ClearLastError(notchfill_handle *handle) {
    handle->last_error.clear();
}

bool IsValidState(const notchfill_window_state_t *state) {
    return state != nullptr && state->fullscreen <= static_cast<uint32_t>(NOTCHFILL_FULLSCREEN_FULLHEIGHT);
}

} // namespace

extern "C" {

notchfill_handle_t *notchfill_create(const notchfill_config_t *config) {
    if (config != nullptr && config->struct_size < sizeof(notchfill_config_t)) {
        return nullptr;
    }

    try {
        auto *handle = new notchfill_handle();
        if (config != nullptr) {
            handle->host.nativeFullScreen = (config->flags & NOTCHFILL_CONFIG_NATIVE_FULLSCREEN) != 0;
            if (config->flags & NOTCHFILL_CONFIG_EMPTY_RATIO_TABLE) {
                handle->config.notch.screenRatios = std::vector<notch::ScreenRatio>{};
            }
        }
        return handle;
    } catch (const std::exception &) {
        return nullptr;
    }
}

void notchfill_destroy(notchfill_handle_t *handle) {
    if (handle != nullptr) {
        const auto sink_state = devlog::GetLogSink();
        if (sink_state.sink == &DevLogSink && sink_state.user_data == handle) {
            devlog::SetLogSink(nullptr, nullptr);
        }
    }
    delete handle;
}

void notchfill_set_log_callback(notchfill_handle_t *handle, notchfill_log_callback_t callback, void *user_data) {
    if (handle == nullptr) {
        return;
    }
    handle->log_callback = callback;
    handle->log_user_data = user_data;
    if (callback != nullptr) {
        devlog::SetLogSink(&DevLogSink, handle);
    } else {
        const auto sink_state = devlog::GetLogSink();
        if (sink_state.sink == &DevLogSink && sink_state.user_data == handle) {
            devlog::SetLogSink(nullptr, nullptr);
        }
    }
}

const char *notchfill_get_last_error(const notchfill_handle_t *handle) {
    if (handle == nullptr) {
        return "Invalid handle";
    }
    return handle->last_error.c_str();
}

notchfill_result_t notchfill_clear_screen_ratios(notchfill_handle_t *handle) {
    if (handle == nullptr) {
        return NOTCHFILL_RESULT_INVALID_ARGUMENT;
    }
    ClearLastError(handle);
    handle->config.notch.screenRatios = std::vector<notch::ScreenRatio>{};
    return NOTCHFILL_RESULT_OK;
}

notchfill_result_t notchfill_add_screen_ratio(notchfill_handle_t *handle, double ratio, double notch_percent) {
    if (handle == nullptr) {
        return NOTCHFILL_RESULT_INVALID_ARGUMENT;
    }
    if (!std::isfinite(ratio) || ratio <= 0.0) {
        return SetLastError(handle, NOTCHFILL_RESULT_INVALID_ARGUMENT,
                            fmt::format("Screen ratio must be positive, got {}", ratio));
    }
    if (!std::isfinite(notch_percent) || notch_percent < 0.0 || notch_percent > 100.0) {
        return SetLastError(handle, NOTCHFILL_RESULT_INVALID_ARGUMENT,
                            fmt::format("Notch percentage must be within [0, 100], got {}", notch_percent));
    }

    try {
        auto ratios = handle->config.notch.screenRatios.Get();
        ratios.push_back({ratio, notch_percent});
        handle->config.notch.screenRatios = std::move(ratios);
    } catch (const std::exception &e) {
        return SetLastError(handle, NOTCHFILL_RESULT_INTERNAL_ERROR, e.what());
    }
    ClearLastError(handle);
    return NOTCHFILL_RESULT_OK;
}

notchfill_result_t notchfill_set_ratio_tolerance(notchfill_handle_t *handle, double tolerance) {
    if (handle == nullptr) {
        return NOTCHFILL_RESULT_INVALID_ARGUMENT;
    }
    if (!std::isfinite(tolerance) || tolerance < 0.0) {
        return SetLastError(handle, NOTCHFILL_RESULT_INVALID_ARGUMENT,
                            fmt::format("Ratio tolerance must be non-negative, got {}", tolerance));
    }
    ClearLastError(handle);
    handle->config.notch.ratioTolerance = tolerance;
    return NOTCHFILL_RESULT_OK;
}

notchfill_result_t notchfill_set_heights(notchfill_handle_t *handle, double fullscreen_height, double normal_height,
                                         double max_height) {
    if (handle == nullptr) {
        return NOTCHFILL_RESULT_INVALID_ARGUMENT;
    }
    if (!std::isfinite(fullscreen_height) || !std::isfinite(normal_height) || !std::isfinite(max_height)) {
        return SetLastError(handle, NOTCHFILL_RESULT_INVALID_ARGUMENT, "Heights must be finite numbers");
    }
    if (max_height < notch::kMinHeight) {
        return SetLastError(handle, NOTCHFILL_RESULT_INVALID_ARGUMENT,
                            fmt::format("Maximum height must be at least {}, got {}", notch::kMinHeight, max_height));
    }
    ClearLastError(handle);
    handle->config.notch.fullScreenHeight = fullscreen_height;
    handle->config.notch.normalHeight = normal_height;
    handle->config.notch.maxHeight = max_height;
    return NOTCHFILL_RESULT_OK;
}

void notchfill_set_native_fullscreen(notchfill_handle_t *handle, bool enabled) {
    if (handle != nullptr) {
        handle->host.nativeFullScreen = enabled;
    }
}

void notchfill_set_marker_enabled(notchfill_handle_t *handle, bool enabled) {
    if (handle != nullptr) {
        handle->host.markerEnabled = enabled;
    }
}

notchfill_result_t notchfill_notch_height_pixels(const notchfill_handle_t *handle, uint32_t screen_width,
                                                 uint32_t screen_height, uint32_t *out_pixels) {
    if (handle == nullptr || out_pixels == nullptr || screen_height == 0) {
        return NOTCHFILL_RESULT_INVALID_ARGUMENT;
    }
    *out_pixels = handle->engine.NotchHeightPixels(screen_width, screen_height);
    return NOTCHFILL_RESULT_OK;
}

notchfill_result_t notchfill_compute_multiplier(const notchfill_handle_t *handle,
                                                const notchfill_window_state_t *state, double *out_multiplier) {
    if (handle == nullptr || out_multiplier == nullptr || !IsValidState(state)) {
        return NOTCHFILL_RESULT_INVALID_ARGUMENT;
    }
    const StateWindow window{*state, nullptr};
    *out_multiplier = handle->engine.ComputeMultiplier(window);
    return NOTCHFILL_RESULT_OK;
}

notchfill_result_t notchfill_refresh(notchfill_handle_t *handle, const notchfill_window_state_t *state,
                                     double *out_height, uint64_t *out_style_id, bool *out_changed) {
    if (handle == nullptr) {
        return NOTCHFILL_RESULT_INVALID_ARGUMENT;
    }
    if (!IsValidState(state)) {
        return SetLastError(handle, NOTCHFILL_RESULT_INVALID_ARGUMENT, "Invalid window state");
    }

    try {
        StateWindow window{*state, &handle->host.windowStyles};
        handle->host.styleChanged = false;
        if (handle->engine.Refresh(window) == notch::ListenerResult::Unsubscribe) {
            return SetDetached(handle);
        }

        const notch::StyleHandle style = handle->engine.ResolveStyleHandle(window);
        if (out_height != nullptr) {
            *out_height = handle->host.GetStyleHeight(style);
        }
        if (out_style_id != nullptr) {
            *out_style_id = style.id;
        }
        if (out_changed != nullptr) {
            *out_changed = handle->host.styleChanged;
        }
    } catch (const std::exception &e) {
        return SetLastError(handle, NOTCHFILL_RESULT_INTERNAL_ERROR, e.what());
    }
    ClearLastError(handle);
    return NOTCHFILL_RESULT_OK;
}

void notchfill_release_window(notchfill_handle_t *handle, uint64_t window_id) {
    if (handle == nullptr) {
        return;
    }
    auto it = handle->host.windowStyles.find(window_id);
    if (it != handle->host.windowStyles.end()) {
        handle->host.styleHeights.erase(it->second.id);
        handle->host.windowStyles.erase(it);
    }
}

} // extern "C"
