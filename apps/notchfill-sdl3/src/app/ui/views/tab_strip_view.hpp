#pragma once

#include "tab_strip_model.hpp"

#include <app/sdl_host.hpp>
#include <app/shared_context.hpp>

namespace app::ui {

class TabStripView {
public:
    TabStripView(SharedContext &context, TabStripModel &model);

    /// Draws the tab strip along the top of the viewport and the selected page below it.
    void Display(SDLWindow &window);

private:
    SharedContext &m_context;
    TabStripModel &m_model;

    float DisplayStrip(SDLWindow &window);
    void DisplayOverview(const SDLWindow &window) const;
    void DisplaySettings();

    static const char *GetFullScreenStateLabel(notchfill::host::FullScreenState state);
};

} // namespace app::ui
