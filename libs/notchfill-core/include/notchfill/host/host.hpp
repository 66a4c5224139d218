#pragma once

/**
@file
@brief Host environment interface.

The host provides global display state, owns the style resources the tab strip is rendered with and hosts the resize
notification channel.
*/

#include "window.hpp"

#include <notchfill/notch/resize_channel.hpp>
#include <notchfill/notch/style_handle.hpp>

#include <string_view>

namespace notchfill::host {

class Host {
public:
    virtual ~Host() = default;

    /// @brief Whether the display can render units of variable height. Text terminals return `false`.
    virtual bool IsGraphical() const = 0;

    /// @brief Whether the host uses the operating system's native fullscreen mode.
    virtual bool IsNativeFullScreenEnabled() const = 0;

    /// @brief Whether the tab strip rendering pipeline currently includes the element named `marker`.
    virtual bool IsInTabStripPipeline(std::string_view marker) const = 0;

    /// @brief Creates the style resource named by `handle`. The style starts with a height of 1.0.
    virtual void CreateStyle(const notch::StyleHandle &handle) = 0;

    /// @brief Reads the height multiplier of a style created with `CreateStyle`.
    virtual double GetStyleHeight(const notch::StyleHandle &handle) const = 0;

    /// @brief Changes the height multiplier of a style created with `CreateStyle`.
    virtual void SetStyleHeight(const notch::StyleHandle &handle, double height) = 0;

    virtual notch::ResizeChannel &GetResizeChannel() = 0;
};

} // namespace notchfill::host
