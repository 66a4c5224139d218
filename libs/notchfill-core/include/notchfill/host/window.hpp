#pragma once

/**
@file
@brief Host window interface.

The host windowing system implements this interface for each of its windows. The engine only queries geometry and
state, and stores its style handle as an attribute of the window.
*/

#include <notchfill/notch/style_handle.hpp>

#include <notchfill/core/types.hpp>

#include <optional>

namespace notchfill::host {

/// @brief The host's fullscreen attribute of a window.
///
/// The engine treats every value other than `None` as fullscreen.
enum class FullScreenState : uint8 {
    None,
    Maximized,
    FullBoth,
    FullWidth,
    FullHeight,
};

class Window {
public:
    virtual ~Window() = default;

    /// @brief The host's identifier for this window. Only used for logging.
    virtual uint64 GetID() const = 0;

    virtual uint32 GetPixelWidth() const = 0;
    virtual uint32 GetPixelHeight() const = 0;

    /// @brief Height of one line of text in pixels.
    virtual uint32 GetCharHeight() const = 0;

    virtual FullScreenState GetFullScreenState() const = 0;

    /// @brief Retrieves the style handle previously attached with `SetStyleHandle`, if any.
    virtual std::optional<notch::StyleHandle> GetStyleHandle() const = 0;

    /// @brief Attaches a style handle to this window.
    virtual void SetStyleHandle(const notch::StyleHandle &handle) = 0;
};

} // namespace notchfill::host
