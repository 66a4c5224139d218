#include "settings.hpp"

#include <notchfill/notch/height_engine.hpp>
#include <notchfill/util/dev_log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <concepts>
#include <fstream>

using namespace std::literals;
using namespace notchfill;

namespace app {

template <typename T>
concept arithmetic_type = std::integral<T> || std::floating_point<T>;

// Increment this version when making breaking changes to the settings file structure.
// The loader should convert old file formats on a best-effort basis.
inline constexpr int kConfigVersion = 1;

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // settings

    struct settings {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Settings";
    };

} // namespace grp

using core::config::notch::ScreenRatio;

// -------------------------------------------------------------------------------------------------
// Parsers

template <typename T>
static void Parse(toml::node_view<toml::node> &node, T &value) {
    if (auto opt = node.value<T>()) {
        value = *opt;
    }
}

template <typename T>
static void Parse(toml::node_view<toml::node> &node, const char *name, T &value) {
    toml::node_view view{node[name]};
    Parse(view, value);
}

template <arithmetic_type T>
static void Parse(toml::node_view<toml::node> &node, const char *name, T &value, T defaultValue, T minValue,
                  T maxValue) {
    toml::node_view view{node[name]};
    value = defaultValue;
    Parse(view, value);
    value = std::clamp<T>(value, minValue, maxValue);
}

template <typename T>
static void Parse(toml::node_view<toml::node> &node, const char *name, util::Observable<T> &value) {
    T wrappedValue = value.Get();
    Parse(node, name, wrappedValue);
    value = wrappedValue;
}

template <arithmetic_type T>
static void Parse(toml::node_view<toml::node> &node, const char *name, util::Observable<T> &value, T defaultValue,
                  T minValue, T maxValue) {
    T wrappedValue = value.Get();
    Parse(node, name, wrappedValue, defaultValue, minValue, maxValue);
    value = wrappedValue;
}

// Reads screen ratio entries, skipping malformed ones.
static void Parse(toml::node_view<toml::node> &node, const char *name, std::vector<ScreenRatio> &value) {
    toml::array *arr = node[name].as_array();
    if (arr == nullptr) {
        return;
    }

    value.clear();
    for (size_t i = 0; toml::node &entry : *arr) {
        toml::table *tbl = entry.as_table();
        std::optional<double> ratio = tbl != nullptr ? (*tbl)["Ratio"].value<double>() : std::nullopt;
        std::optional<double> percent = tbl != nullptr ? (*tbl)["NotchPercent"].value<double>() : std::nullopt;
        if (!ratio || !percent) {
            devlog::warn<grp::settings>("Skipping screen ratio entry #{}: missing Ratio or NotchPercent", i);
        } else if (!std::isfinite(*ratio) || *ratio <= 0.0) {
            devlog::warn<grp::settings>("Skipping screen ratio entry #{}: ratio {} is not positive", i, *ratio);
        } else if (!std::isfinite(*percent) || *percent < 0.0 || *percent > 100.0) {
            devlog::warn<grp::settings>("Skipping screen ratio entry #{}: notch percentage {} is out of range", i,
                                        *percent);
        } else {
            value.push_back({*ratio, *percent});
        }
        ++i;
    }
}

// -------------------------------------------------------------------------------------------------
// Value-to-TOML converters

static toml::array ToTOML(const std::vector<ScreenRatio> &value) {
    toml::array out{};
    for (const ScreenRatio &entry : value) {
        out.push_back(toml::table{{
            {"Ratio", entry.ratio},
            {"NotchPercent", entry.notchPercent},
        }});
    }
    return out;
}

// -------------------------------------------------------------------------------------------------
// Results

SettingsLoadResult SettingsLoadResult::TOMLParseError(const toml::parse_error &error) {
    SettingsLoadResult result{};
    result.type = Type::TOMLParseError;
    result.parseError = fmt::format("{} (line {}, column {})", error.description(), error.source().begin.line,
                                    error.source().begin.column);
    return result;
}

std::string SettingsLoadResult::string() const {
    switch (type) {
    case Type::Success: return "Success";
    case Type::TOMLParseError: return fmt::format("Error parsing TOML file: {}", parseError);
    case Type::UnsupportedConfigVersion:
        return fmt::format("Unsupported configuration version {}; expected {} or older", configVersion,
                           kConfigVersion);
    }
    return "Unknown error";
}

std::string SettingsSaveResult::string() const {
    switch (type) {
    case Type::Success: return "Success";
    case Type::FilesystemError: return fmt::format("Filesystem error: {}", error.message());
    }
    return "Unknown error";
}

// -------------------------------------------------------------------------------------------------
// Settings

Settings::Settings() {
    ResetToDefaults();
}

void Settings::ResetToDefaults() {
    namespace defaults = core::config::notch;

    notch.enabled = true;
    notch.screenRatios = defaults::DefaultScreenRatios();
    notch.ratioTolerance = defaults::kDefaultRatioTolerance;
    notch.fullScreenHeight = defaults::kDefaultFullScreenHeight;
    notch.normalHeight = defaults::kDefaultNormalHeight;
    notch.maxHeight = defaults::kDefaultMaxHeight;

    video.nativeFullScreen = false;
    video.fullScreen = false;
    video.windowWidth = 1280;
    video.windowHeight = 800;
}

void Settings::BindConfiguration(core::Configuration &config) {
    notch.screenRatios.Observe(config.notch.screenRatios);
    notch.ratioTolerance.Observe(config.notch.ratioTolerance);
    notch.fullScreenHeight.Observe(config.notch.fullScreenHeight);
    notch.normalHeight.Observe(config.notch.normalHeight);
    notch.maxHeight.Observe(config.notch.maxHeight);

    notch.screenRatios.Notify();
    notch.ratioTolerance.Notify();
    notch.fullScreenHeight.Notify();
    notch.normalHeight.Notify();
    notch.maxHeight.Notify();
}

SettingsLoadResult Settings::Load(const std::filesystem::path &path) {
    // Use defaults if configuration file does not exist
    if (!std::filesystem::is_regular_file(path)) {
        ResetToDefaults();
        this->path = path;
        return SettingsLoadResult::Success();
    }

    auto parseResult = toml::parse_file(path.native());
    if (parseResult.failed()) {
        return SettingsLoadResult::TOMLParseError(parseResult.error());
    }
    auto &data = parseResult.table();

    int configVersion = 0;
    if (auto opt = data["ConfigVersion"].value<int>()) {
        configVersion = *opt;
    }
    if (configVersion > kConfigVersion) {
        return SettingsLoadResult::UnsupportedConfigVersion(configVersion);
    }

    ResetToDefaults();

    if (auto tblNotch = data["Notch"]) {
        Parse(tblNotch, "Enabled", notch.enabled);

        auto screenRatios = notch.screenRatios.Get();
        Parse(tblNotch, "ScreenRatios", screenRatios);
        notch.screenRatios = std::move(screenRatios);

        namespace defaults = core::config::notch;
        Parse(tblNotch, "RatioTolerance", notch.ratioTolerance, defaults::kDefaultRatioTolerance, kMinRatioTolerance,
              kMaxRatioTolerance);
        Parse(tblNotch, "FullScreenHeight", notch.fullScreenHeight, defaults::kDefaultFullScreenHeight,
              notchfill::notch::kMinHeight, kMaxHeightSetting);
        Parse(tblNotch, "NormalHeight", notch.normalHeight, defaults::kDefaultNormalHeight,
              notchfill::notch::kMinHeight, kMaxHeightSetting);
        Parse(tblNotch, "MaxHeight", notch.maxHeight, defaults::kDefaultMaxHeight, notchfill::notch::kMinHeight,
              kMaxHeightSetting);
    }

    if (auto tblVideo = data["Video"]) {
        Parse(tblVideo, "NativeFullScreen", video.nativeFullScreen);
        Parse(tblVideo, "FullScreen", video.fullScreen);
        Parse(tblVideo, "WindowWidth", video.windowWidth, 1280, 320, 16384);
        Parse(tblVideo, "WindowHeight", video.windowHeight, 800, 240, 16384);
    }

    devlog::debug<grp::settings>("Loaded settings from {}", path.string());

    this->path = path;
    return SettingsLoadResult::Success();
}

SettingsSaveResult Settings::Save() {
    if (path.empty()) {
        path = kSettingsFile;
    }

    // clang-format off
    auto tbl = toml::table{{
        {"ConfigVersion", kConfigVersion},

        {"Notch", toml::table{{
            {"Enabled", notch.enabled.Get()},
            {"ScreenRatios", ToTOML(notch.screenRatios.Get())},
            {"RatioTolerance", notch.ratioTolerance.Get()},
            {"FullScreenHeight", notch.fullScreenHeight.Get()},
            {"NormalHeight", notch.normalHeight.Get()},
            {"MaxHeight", notch.maxHeight.Get()},
        }}},

        {"Video", toml::table{{
            {"NativeFullScreen", video.nativeFullScreen},
            {"FullScreen", video.fullScreen},
            {"WindowWidth", video.windowWidth},
            {"WindowHeight", video.windowHeight},
        }}},
    }};
    // clang-format on

    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    out << tbl;
    if (!out) {
        std::error_code error{errno, std::generic_category()};
        return SettingsSaveResult::FilesystemError(error);
    }

    return SettingsSaveResult::Success();
}

void Settings::CheckDirty() {
    using namespace std::chrono_literals;

    if (m_dirty && (std::chrono::steady_clock::now() - m_dirtyTimestamp) > 250ms) {
        if (auto result = Save(); !result) {
            devlog::warn<grp::settings>("Failed to save settings: {}", result.string());
        }
        m_dirty = false;
    }
}

void Settings::MakeDirty() {
    m_dirty = true;
    m_dirtyTimestamp = std::chrono::steady_clock::now();
}

} // namespace app
