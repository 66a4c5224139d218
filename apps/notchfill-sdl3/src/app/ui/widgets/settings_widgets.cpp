#include "settings_widgets.hpp"

#include <notchfill/notch/height_engine.hpp>

#include <imgui.h>

#include <algorithm>
#include <vector>

using namespace notchfill;

namespace app::ui::widgets {

namespace {

    constexpr double kMinHeight = notchfill::notch::kMinHeight;
    constexpr double kMaxHeight = kMaxHeightSetting;
    constexpr double kMinTolerance = kMinRatioTolerance;
    constexpr double kMaxTolerance = kMaxRatioTolerance;

    void ExplanationTooltip(const char *explanation, float displayScale) {
        ImGui::SameLine();
        ImGui::TextDisabled("(?)");
        if (ImGui::BeginItemTooltip()) {
            ImGui::PushTextWrapPos(450.0f * displayScale);
            ImGui::TextUnformatted(explanation);
            ImGui::PopTextWrapPos();
            ImGui::EndTooltip();
        }
    }

    bool HeightSlider(const char *label, util::Observable<double> &value, float displayScale) {
        double height = value.Get();
        ImGui::SetNextItemWidth(280.0f * displayScale);
        if (ImGui::SliderScalar(label, ImGuiDataType_Double, &height, &kMinHeight, &kMaxHeight, "%.2f lines")) {
            value = std::clamp(height, kMinHeight, kMaxHeight);
            return true;
        }
        return false;
    }

} // namespace

namespace settings::notch {

    void MarkerEnabled(SharedContext &ctx) {
        auto &settings = ctx.settings;
        bool enabled = settings.notch.enabled;
        if (settings.MakeDirty(ImGui::Checkbox("Fill the notch area with the tab strip", &enabled))) {
            settings.notch.enabled = enabled;
        }
        ExplanationTooltip("Adds a blank marker to the tab strip that grows to cover the display notch when the "
                           "window fills a notched screen.\n\n"
                           "Unchecking this removes the marker and detaches the height engine until the next "
                           "restart.",
                           ctx.displayScale);
    }

    void Heights(SharedContext &ctx) {
        auto &settings = ctx.settings;
        settings.MakeDirty(HeightSlider("Normal height", settings.notch.normalHeight, ctx.displayScale));
        ExplanationTooltip("Tab strip height when the window is not fullscreen.", ctx.displayScale);

        settings.MakeDirty(HeightSlider("Fullscreen height", settings.notch.fullScreenHeight, ctx.displayScale));
        ExplanationTooltip("Tab strip height in fullscreen on displays without a known notch.", ctx.displayScale);

        settings.MakeDirty(HeightSlider("Maximum height", settings.notch.maxHeight, ctx.displayScale));
        ExplanationTooltip("Upper limit for any computed tab strip height.", ctx.displayScale);
    }

    void RatioTolerance(SharedContext &ctx) {
        auto &settings = ctx.settings;
        double tolerance = settings.notch.ratioTolerance;
        ImGui::SetNextItemWidth(280.0f * ctx.displayScale);
        if (settings.MakeDirty(ImGui::SliderScalar("Ratio tolerance", ImGuiDataType_Double, &tolerance,
                                                   &kMinTolerance, &kMaxTolerance, "%.4f",
                                                   ImGuiSliderFlags_Logarithmic))) {
            settings.notch.ratioTolerance = std::clamp(tolerance, kMinTolerance, kMaxTolerance);
        }
        ExplanationTooltip("How far a window's aspect ratio may be from a table entry and still match it.",
                           ctx.displayScale);
    }

    void ScreenRatioTable(SharedContext &ctx) {
        auto &settings = ctx.settings;
        std::vector<core::config::notch::ScreenRatio> ratios = settings.notch.screenRatios;
        bool changed = false;
        std::optional<size_t> removeIndex{};

        constexpr ImGuiTableFlags flags =
            ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerV | ImGuiTableFlags_SizingFixedFit;
        if (ImGui::BeginTable("screen_ratios", 3, flags)) {
            ImGui::TableSetupColumn("Aspect ratio", ImGuiTableColumnFlags_WidthFixed, 140.0f * ctx.displayScale);
            ImGui::TableSetupColumn("Notch %", ImGuiTableColumnFlags_WidthFixed, 140.0f * ctx.displayScale);
            ImGui::TableSetupColumn("", ImGuiTableColumnFlags_WidthFixed, 80.0f * ctx.displayScale);
            ImGui::TableHeadersRow();

            for (size_t i = 0; i < ratios.size(); ++i) {
                auto &entry = ratios[i];
                ImGui::PushID(static_cast<int>(i));
                ImGui::TableNextRow();

                ImGui::TableNextColumn();
                ImGui::SetNextItemWidth(-FLT_MIN);
                if (ImGui::InputDouble("##ratio", &entry.ratio, 0.0, 0.0, "%.4f")) {
                    entry.ratio = std::max(entry.ratio, 0.0001);
                    changed = true;
                }

                ImGui::TableNextColumn();
                ImGui::SetNextItemWidth(-FLT_MIN);
                if (ImGui::InputDouble("##percent", &entry.notchPercent, 0.0, 0.0, "%.3f")) {
                    entry.notchPercent = std::clamp(entry.notchPercent, 0.0, 100.0);
                    changed = true;
                }

                ImGui::TableNextColumn();
                if (ImGui::SmallButton("Remove")) {
                    removeIndex = i;
                }
                ImGui::PopID();
            }

            ImGui::EndTable();
        }

        if (removeIndex) {
            ratios.erase(ratios.begin() + *removeIndex);
            changed = true;
        }

        if (ImGui::Button("Add")) {
            ratios.push_back({16.0 / 10.0, 0.0});
            changed = true;
        }
        ImGui::SameLine();
        if (ImGui::Button("Restore defaults")) {
            ratios = core::config::notch::DefaultScreenRatios();
            changed = true;
        }

        if (settings.MakeDirty(changed)) {
            settings.notch.screenRatios = std::move(ratios);
        }
    }

} // namespace settings::notch

namespace settings::video {

    void NativeFullScreen(SharedContext &ctx) {
        auto &settings = ctx.settings;
        settings.MakeDirty(ImGui::Checkbox("Use native fullscreen spaces", &settings.video.nativeFullScreen));
        ExplanationTooltip("Uses the operating system's own fullscreen mode, which already keeps content clear of "
                           "the notch.\n\n"
                           "The notch filler is inactive in this mode.\n"
                           "Takes effect after restarting the application.",
                           ctx.displayScale);
    }

} // namespace settings::video

} // namespace app::ui::widgets
