#pragma once

#include "settings.hpp"

#include <notchfill/host/host.hpp>

#include <SDL3/SDL_video.h>

#include <unordered_map>

namespace app {

/// @brief Exposes an SDL window to the height engine.
///
/// The style handle is stored in the window's SDL properties, so it disappears together with the window.
class SDLWindow final : public notchfill::host::Window {
public:
    explicit SDLWindow(SDL_Window *window);

    uint64 GetID() const override;
    uint32 GetPixelWidth() const override;
    uint32 GetPixelHeight() const override;
    uint32 GetCharHeight() const override;
    notchfill::host::FullScreenState GetFullScreenState() const override;

    std::optional<notchfill::notch::StyleHandle> GetStyleHandle() const override;
    void SetStyleHandle(const notchfill::notch::StyleHandle &handle) override;

    /// @brief Updates the text line height. Returns `true` if it changed.
    bool SetCharHeight(uint32 charHeight);

private:
    SDL_Window *m_window;
    uint32 m_charHeight = 0;
};

class SDLHost final : public notchfill::host::Host {
public:
    explicit SDLHost(const Settings &settings);

    bool IsGraphical() const override;
    bool IsNativeFullScreenEnabled() const override;
    bool IsInTabStripPipeline(std::string_view marker) const override;

    void CreateStyle(const notchfill::notch::StyleHandle &handle) override;
    double GetStyleHeight(const notchfill::notch::StyleHandle &handle) const override;
    void SetStyleHeight(const notchfill::notch::StyleHandle &handle, double height) override;

    notchfill::notch::ResizeChannel &GetResizeChannel() override {
        return m_resizeChannel;
    }

    /// @brief Records whether native fullscreen spaces were enabled when the video subsystem started.
    void SetNativeFullScreen(bool enabled) {
        m_nativeFullScreen = enabled;
    }

private:
    const Settings &m_settings;
    bool m_nativeFullScreen = false;
    std::unordered_map<uint64, double> m_styleHeights; // style ID -> height multiplier
    notchfill::notch::ResizeChannel m_resizeChannel;
};

} // namespace app
