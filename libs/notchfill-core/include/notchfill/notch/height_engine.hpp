#pragma once

/**
@file
@brief Tab strip height engine.

Computes the tab strip height that covers the display notch when a window fills a notched screen, and applies it to
the window's style only when it changes.

The engine subscribes to the host's resize channel the first time the tab strip renders its marker. It unsubscribes
itself for good as soon as the marker is removed from the tab strip pipeline.
*/

#include "ratio_matcher.hpp"
#include "resize_channel.hpp"
#include "style_handle.hpp"

#include <notchfill/core/configuration.hpp>
#include <notchfill/host/host.hpp>

#include <notchfill/core/types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace notchfill::notch {

/// @brief Minimum difference between two heights for the style to be updated.
inline constexpr double kHeightEpsilon = 1e-6;

/// @brief Lower bound of every computed height multiplier.
inline constexpr double kMinHeight = 1.0;

/// @brief Name of the tab strip pipeline element contributed by the engine.
inline constexpr std::string_view kMarkerName = "notch-filler";

/// @brief A blank rendering unit inserted into the tab strip.
struct MarkerUnit {
    std::string text;
    std::optional<StyleHandle> style; ///< Unset on non-graphical displays
};

/// @brief State of the engine's resize listener. The only transition is `Active` -> `Removed`.
enum class ListenerState : uint8 {
    Active,
    Removed,
};

class HeightEngine {
public:
    /// @brief Creates an engine bound to the given host and configuration. Both must outlive the engine.
    HeightEngine(host::Host &host, const core::Configuration &config);
    ~HeightEngine();

    HeightEngine(const HeightEngine &) = delete;
    HeightEngine &operator=(const HeightEngine &) = delete;

    /// @brief Determines if the window is stretched over the screen in non-native fullscreen.
    [[nodiscard]] bool IsFullScreen(const host::Window &window) const;

    /// @brief Computes the notch height in pixels for a screen of the given size using the configured table.
    [[nodiscard]] uint32 NotchHeightPixels(uint32 width, uint32 height) const;

    /// @brief Computes the tab strip height multiplier for the window, clamped to [1.0, max height].
    [[nodiscard]] double ComputeMultiplier(const host::Window &window) const;

    /// @brief Recomputes and applies the window's tab strip height.
    ///
    /// Safe to call on every resize or redraw; the style is only written when the height changes.
    ///
    /// @param[in] window the window to refresh
    /// @return `ListenerResult::Unsubscribe` once the marker is no longer part of the tab strip pipeline
    ListenerResult Refresh(host::Window &window);

    /// @brief Produces the marker unit for the window's tab strip.
    ///
    /// The first call on a graphical display subscribes the engine to the host's resize channel.
    MarkerUnit RenderMarker(host::Window &window);

    /// @brief Retrieves the window's style handle, creating and attaching a new one if the window has none.
    StyleHandle ResolveStyleHandle(host::Window &window);

    [[nodiscard]] ListenerState GetListenerState() const {
        return m_listenerState;
    }

    /// @brief Whether the engine is currently subscribed to the host's resize channel.
    [[nodiscard]] bool IsListening() const;

private:
    host::Host &m_host;
    const core::Configuration &m_config;

    bool m_listenerRegistered = false;
    ListenerID m_listenerID = kInvalidListenerID;
    ListenerState m_listenerState = ListenerState::Active;

    static ListenerResult OnWindowResized(host::Window &window, void *ctx);
};

} // namespace notchfill::notch
