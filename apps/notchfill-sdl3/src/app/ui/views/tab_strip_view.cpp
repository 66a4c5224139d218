#include "tab_strip_view.hpp"

#include <app/ui/widgets/settings_widgets.hpp>

#include <imgui.h>

#include <algorithm>

using namespace notchfill;

namespace app::ui {

TabStripView::TabStripView(SharedContext &context, TabStripModel &model)
    : m_context(context)
    , m_model(model) {}

void TabStripView::Display(SDLWindow &window) {
    const ImGuiViewport *viewport = ImGui::GetMainViewport();
    const float stripHeight = DisplayStrip(window);

    ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x, viewport->WorkPos.y + stripHeight));
    ImGui::SetNextWindowSize(ImVec2(viewport->WorkSize.x, std::max(viewport->WorkSize.y - stripHeight, 0.0f)));
    constexpr ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoSavedSettings;
    if (ImGui::Begin("##page", nullptr, flags)) {
        switch (m_model.selectedPage) {
        case TabStripModel::Page::Overview: DisplayOverview(window); break;
        case TabStripModel::Page::Settings: DisplaySettings(); break;
        }
    }
    ImGui::End();
}

float TabStripView::DisplayStrip(SDLWindow &window) {
    const ImGuiViewport *viewport = ImGui::GetMainViewport();
    const ImGuiStyle &style = ImGui::GetStyle();
    const float lineHeight = ImGui::GetTextLineHeight();

    // The marker only takes part in the strip while it is in the pipeline
    std::optional<notch::MarkerUnit> marker{};
    double height = 1.0;
    if (m_context.host.IsInTabStripPipeline(notch::kMarkerName)) {
        marker = m_context.engine.RenderMarker(window);
        if (marker->style) {
            height = m_context.host.GetStyleHeight(*marker->style);
        }
    }
    m_model.lastHeight = height;

    const float markerHeight = static_cast<float>(height) * lineHeight;
    const float tabBarHeight = ImGui::GetFrameHeight();
    const float contentHeight = std::max(markerHeight, tabBarHeight);
    const float stripHeight = contentHeight + style.WindowPadding.y * 2.0f;

    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(ImVec2(viewport->WorkSize.x, stripHeight));
    constexpr ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                       ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoScrollbar;
    if (ImGui::Begin("##tab_strip", nullptr, flags)) {
        const float top = ImGui::GetCursorPosY();
        if (marker) {
            ImGui::Dummy(ImVec2(ImGui::CalcTextSize(marker->text.c_str()).x, markerHeight));
            ImGui::SameLine(0.0f, 0.0f);
        }

        // Tabs hang from the bottom edge of the strip, below the notch
        ImGui::SetCursorPosY(top + contentHeight - tabBarHeight);
        if (ImGui::BeginTabBar("tab_strip_tabs")) {
            if (ImGui::BeginTabItem("Overview")) {
                m_model.selectedPage = TabStripModel::Page::Overview;
                ImGui::EndTabItem();
            }
            if (ImGui::BeginTabItem("Settings")) {
                m_model.selectedPage = TabStripModel::Page::Settings;
                ImGui::EndTabItem();
            }
            ImGui::EndTabBar();
        }
    }
    ImGui::End();

    return stripHeight;
}

void TabStripView::DisplayOverview(const SDLWindow &window) const {
    const auto &engine = m_context.engine;
    const uint32 width = window.GetPixelWidth();
    const uint32 height = window.GetPixelHeight();

    ImGui::SeparatorText("Window");
    ImGui::Text("Size: %ux%u pixels", width, height);
    ImGui::Text("Text line height: %u pixels", window.GetCharHeight());
    ImGui::Text("Fullscreen state: %s", GetFullScreenStateLabel(window.GetFullScreenState()));
    ImGui::Text("Native fullscreen: %s", m_context.host.IsNativeFullScreenEnabled() ? "enabled" : "disabled");

    ImGui::SeparatorText("Notch");
    ImGui::Text("Treated as fullscreen: %s", engine.IsFullScreen(window) ? "yes" : "no");
    ImGui::Text("Notch height: %u pixels", engine.NotchHeightPixels(width, height));
    ImGui::Text("Computed height: %.3f lines", engine.ComputeMultiplier(window));
    ImGui::Text("Applied height: %.3f lines", m_model.lastHeight);
    if (auto handle = window.GetStyleHandle()) {
        ImGui::Text("Style: %s", handle->name.c_str());
    } else {
        ImGui::TextDisabled("No style attached");
    }
    ImGui::Text("Resize listener: %s", engine.GetListenerState() == notch::ListenerState::Active
                                           ? (engine.IsListening() ? "subscribed" : "not yet subscribed")
                                           : "removed");

    ImGui::Spacing();
    ImGui::TextDisabled("Press F11 to toggle borderless fullscreen.");
}

void TabStripView::DisplaySettings() {
    ImGui::SeparatorText("Tab strip");
    widgets::settings::notch::MarkerEnabled(m_context);

    ImGui::SeparatorText("Heights");
    widgets::settings::notch::Heights(m_context);

    ImGui::SeparatorText("Notched displays");
    widgets::settings::notch::RatioTolerance(m_context);
    widgets::settings::notch::ScreenRatioTable(m_context);

    ImGui::SeparatorText("Video");
    widgets::settings::video::NativeFullScreen(m_context);
}

const char *TabStripView::GetFullScreenStateLabel(host::FullScreenState state) {
    switch (state) {
    case host::FullScreenState::None: return "none";
    case host::FullScreenState::Maximized: return "maximized";
    case host::FullScreenState::FullBoth: return "full both";
    case host::FullScreenState::FullWidth: return "full width";
    case host::FullScreenState::FullHeight: return "full height";
    }
    return "unknown";
}

} // namespace app::ui
