#pragma once

#include "shared_context.hpp"

#include "ui/views/tab_strip_model.hpp"
#include "ui/views/tab_strip_view.hpp"

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <filesystem>
#include <memory>

namespace app {

class App {
public:
    App();

    int Run(const std::filesystem::path &settingsPath);

private:
    SharedContext m_context;

    ui::TabStripModel m_tabStripModel;
    ui::TabStripView m_tabStripView;

    SDL_Window *m_window = nullptr;
    SDL_Renderer *m_renderer = nullptr;
    std::unique_ptr<SDLWindow> m_hostWindow;

    void LoadSettings(const std::filesystem::path &settingsPath);
    void BindRefreshObservers();

    bool CreateMainWindow();
    void DestroyMainWindow();

    bool ProcessEvent(const SDL_Event &evt, bool &resized);
    void UpdateCharHeight(bool &resized);

    void ToggleFullScreen();
};

} // namespace app
