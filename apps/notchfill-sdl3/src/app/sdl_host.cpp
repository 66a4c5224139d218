#include "sdl_host.hpp"

#include <notchfill/notch/height_engine.hpp>

#include <SDL3/SDL_properties.h>

#include <algorithm>
#include <string_view>

using namespace notchfill;

namespace app {

static constexpr const char *kStyleIDProperty = "notchfill.style.id";

// -----------------------------------------------------------------------------
// SDLWindow

SDLWindow::SDLWindow(SDL_Window *window)
    : m_window(window) {}

uint64 SDLWindow::GetID() const {
    return SDL_GetWindowID(m_window);
}

uint32 SDLWindow::GetPixelWidth() const {
    int width = 0;
    if (!SDL_GetWindowSizeInPixels(m_window, &width, nullptr)) {
        return 0;
    }
    return static_cast<uint32>(std::max(width, 0));
}

uint32 SDLWindow::GetPixelHeight() const {
    int height = 0;
    if (!SDL_GetWindowSizeInPixels(m_window, nullptr, &height)) {
        return 0;
    }
    return static_cast<uint32>(std::max(height, 0));
}

uint32 SDLWindow::GetCharHeight() const {
    return m_charHeight;
}

host::FullScreenState SDLWindow::GetFullScreenState() const {
    const SDL_WindowFlags flags = SDL_GetWindowFlags(m_window);
    if (flags & SDL_WINDOW_FULLSCREEN) {
        return host::FullScreenState::FullBoth;
    }
    if (flags & SDL_WINDOW_MAXIMIZED) {
        return host::FullScreenState::Maximized;
    }
    return host::FullScreenState::None;
}

std::optional<notch::StyleHandle> SDLWindow::GetStyleHandle() const {
    const SDL_PropertiesID props = SDL_GetWindowProperties(m_window);
    if (props == 0 || !SDL_HasProperty(props, kStyleIDProperty)) {
        return std::nullopt;
    }
    const auto id = static_cast<uint64>(SDL_GetNumberProperty(props, kStyleIDProperty, 0));
    return notch::StyleHandle{id, notch::StyleHandleName(id)};
}

void SDLWindow::SetStyleHandle(const notch::StyleHandle &handle) {
    const SDL_PropertiesID props = SDL_GetWindowProperties(m_window);
    if (props != 0) {
        SDL_SetNumberProperty(props, kStyleIDProperty, static_cast<Sint64>(handle.id));
    }
}

bool SDLWindow::SetCharHeight(uint32 charHeight) {
    if (m_charHeight == charHeight) {
        return false;
    }
    m_charHeight = charHeight;
    return true;
}

// -----------------------------------------------------------------------------
// SDLHost

SDLHost::SDLHost(const Settings &settings)
    : m_settings(settings) {}

bool SDLHost::IsGraphical() const {
    // The dummy and offscreen drivers have no display to render variable height units to
    const char *driver = SDL_GetCurrentVideoDriver();
    if (driver == nullptr) {
        return false;
    }
    const std::string_view name{driver};
    return name != "dummy" && name != "offscreen";
}

bool SDLHost::IsNativeFullScreenEnabled() const {
    return m_nativeFullScreen;
}

bool SDLHost::IsInTabStripPipeline(std::string_view marker) const {
    return marker == notch::kMarkerName && m_settings.notch.enabled.Get();
}

void SDLHost::CreateStyle(const notch::StyleHandle &handle) {
    m_styleHeights.emplace(handle.id, 1.0);
}

double SDLHost::GetStyleHeight(const notch::StyleHandle &handle) const {
    auto it = m_styleHeights.find(handle.id);
    return it != m_styleHeights.end() ? it->second : 1.0;
}

void SDLHost::SetStyleHeight(const notch::StyleHandle &handle, double height) {
    m_styleHeights[handle.id] = height;
}

} // namespace app
