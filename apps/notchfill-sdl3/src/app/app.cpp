#include "app.hpp"

#include <notchfill/util/dev_log.hpp>

#include <SDL3/SDL_hints.h>
#include <SDL3/SDL_init.h>

#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>

#include <cmath>
#include <cstdlib>

using namespace notchfill;

namespace app {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "App";
    };

} // namespace grp

App::App()
    : m_tabStripView(m_context, m_tabStripModel) {}

int App::Run(const std::filesystem::path &settingsPath) {
    LoadSettings(settingsPath);
    m_context.settings.BindConfiguration(m_context.config);
    BindRefreshObservers();

    const bool nativeFullScreen = m_context.settings.video.nativeFullScreen;
    SDL_SetHint(SDL_HINT_VIDEO_MAC_FULLSCREEN_SPACES, nativeFullScreen ? "1" : "0");

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        devlog::error<grp::base>("Unable to initialize video subsystem: {}", SDL_GetError());
        return EXIT_FAILURE;
    }
    m_context.host.SetNativeFullScreen(nativeFullScreen);
    devlog::info<grp::base>("Video driver: {}", SDL_GetCurrentVideoDriver());

    if (!CreateMainWindow()) {
        SDL_Quit();
        return EXIT_FAILURE;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO &io = ImGui::GetIO();
    io.IniFilename = nullptr;
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();
    ImGui::GetStyle().ScaleAllSizes(m_context.displayScale);

    ImGui_ImplSDL3_InitForSDLRenderer(m_window, m_renderer);
    ImGui_ImplSDLRenderer3_Init(m_renderer);

    bool running = true;
    while (running) {
        bool resized = false;
        SDL_Event evt{};
        while (SDL_PollEvent(&evt)) {
            ImGui_ImplSDL3_ProcessEvent(&evt);
            if (!ProcessEvent(evt, resized)) {
                running = false;
            }
        }

        ImGui_ImplSDLRenderer3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        UpdateCharHeight(resized);

        // Keep the refresh pending until the engine has subscribed through the first marker render
        if (resized || m_context.refreshPending) {
            if (m_context.host.GetResizeChannel().Notify(*m_hostWindow) > 0) {
                m_context.refreshPending = false;
            }
        }

        m_tabStripView.Display(*m_hostWindow);

        ImGui::Render();
        SDL_SetRenderScale(m_renderer, io.DisplayFramebufferScale.x, io.DisplayFramebufferScale.y);
        SDL_SetRenderDrawColorFloat(m_renderer, 0.08f, 0.08f, 0.10f, 1.0f);
        SDL_RenderClear(m_renderer);
        ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), m_renderer);
        SDL_RenderPresent(m_renderer);

        m_context.settings.CheckDirty();
    }

    if (m_context.settings.IsDirty()) {
        if (auto result = m_context.settings.Save(); !result) {
            devlog::warn<grp::base>("Failed to save settings: {}", result.string());
        }
    }

    ImGui_ImplSDLRenderer3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    DestroyMainWindow();
    SDL_Quit();

    return EXIT_SUCCESS;
}

void App::LoadSettings(const std::filesystem::path &settingsPath) {
    if (auto result = m_context.settings.Load(settingsPath); !result) {
        devlog::warn<grp::base>("Failed to load settings from {}: {}", settingsPath.string(), result.string());
        devlog::warn<grp::base>("Using default settings");
        m_context.settings.ResetToDefaults();
        m_context.settings.path = settingsPath;
    }
}

void App::BindRefreshObservers() {
    auto &notch = m_context.config.notch;
    notch.screenRatios.Observe([this](const auto &) { m_context.refreshPending = true; });
    notch.ratioTolerance.Observe([this](double) { m_context.refreshPending = true; });
    notch.fullScreenHeight.Observe([this](double) { m_context.refreshPending = true; });
    notch.normalHeight.Observe([this](double) { m_context.refreshPending = true; });
    notch.maxHeight.Observe([this](double) { m_context.refreshPending = true; });

    // Removing the marker is only noticed by the engine on its next refresh
    m_context.settings.notch.enabled.Observe([this](bool enabled) {
        devlog::debug<grp::base>("Notch filler marker {}", enabled ? "enabled" : "disabled");
        m_context.refreshPending = true;
    });
}

bool App::CreateMainWindow() {
    const auto &video = m_context.settings.video;

    m_window = SDL_CreateWindow("notchfill", video.windowWidth, video.windowHeight,
                                SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY);
    if (m_window == nullptr) {
        devlog::error<grp::base>("Unable to create window: {}", SDL_GetError());
        return false;
    }

    m_renderer = SDL_CreateRenderer(m_window, nullptr);
    if (m_renderer == nullptr) {
        devlog::error<grp::base>("Unable to create renderer: {}", SDL_GetError());
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
        return false;
    }
    if (!SDL_SetRenderVSync(m_renderer, 1)) {
        devlog::debug<grp::base>("VSync unavailable: {}", SDL_GetError());
    }

    m_hostWindow = std::make_unique<SDLWindow>(m_window);

    const float displayScale = SDL_GetWindowDisplayScale(m_window);
    m_context.displayScale = displayScale > 0.0f ? displayScale : 1.0f;

    if (video.fullScreen) {
        if (!SDL_SetWindowFullscreenMode(m_window, nullptr) || !SDL_SetWindowFullscreen(m_window, true)) {
            devlog::warn<grp::base>("Unable to enter fullscreen: {}", SDL_GetError());
        }
    }
    SDL_ShowWindow(m_window);
    return true;
}

void App::DestroyMainWindow() {
    m_hostWindow.reset();
    if (m_renderer != nullptr) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window != nullptr) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
}

bool App::ProcessEvent(const SDL_Event &evt, bool &resized) {
    switch (evt.type) {
    case SDL_EVENT_QUIT: return false;
    case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
        if (evt.window.windowID == SDL_GetWindowID(m_window)) {
            return false;
        }
        break;
    case SDL_EVENT_WINDOW_RESIZED: [[fallthrough]];
    case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED: [[fallthrough]];
    case SDL_EVENT_WINDOW_MAXIMIZED: [[fallthrough]];
    case SDL_EVENT_WINDOW_RESTORED: [[fallthrough]];
    case SDL_EVENT_WINDOW_ENTER_FULLSCREEN: [[fallthrough]];
    case SDL_EVENT_WINDOW_LEAVE_FULLSCREEN: [[fallthrough]];
    case SDL_EVENT_WINDOW_DISPLAY_CHANGED: [[fallthrough]];
    case SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED:
        if (evt.window.windowID == SDL_GetWindowID(m_window)) {
            resized = true;

            // Remember the windowed size only
            if (evt.type == SDL_EVENT_WINDOW_RESIZED &&
                (SDL_GetWindowFlags(m_window) & (SDL_WINDOW_FULLSCREEN | SDL_WINDOW_MAXIMIZED)) == 0) {
                auto &video = m_context.settings.video;
                video.windowWidth = evt.window.data1;
                video.windowHeight = evt.window.data2;
                m_context.settings.MakeDirty();
            }
        }
        break;
    case SDL_EVENT_KEY_DOWN:
        if (evt.key.key == SDLK_F11 && !evt.key.repeat) {
            ToggleFullScreen();
        }
        break;
    default: break;
    }
    return true;
}

void App::UpdateCharHeight(bool &resized) {
    const float lineHeight = ImGui::GetTextLineHeight() * ImGui::GetIO().DisplayFramebufferScale.y;
    if (m_hostWindow->SetCharHeight(static_cast<uint32>(std::lround(lineHeight)))) {
        resized = true;
    }
}

void App::ToggleFullScreen() {
    const bool fullScreen = (SDL_GetWindowFlags(m_window) & SDL_WINDOW_FULLSCREEN) == 0;

    // Borderless desktop fullscreen, or a native space if those are enabled
    if (!SDL_SetWindowFullscreenMode(m_window, nullptr) || !SDL_SetWindowFullscreen(m_window, fullScreen)) {
        devlog::warn<grp::base>("Unable to {} fullscreen: {}", fullScreen ? "enter" : "leave", SDL_GetError());
        return;
    }

    m_context.settings.video.fullScreen = fullScreen;
    m_context.settings.MakeDirty();
}

} // namespace app
