#pragma once

#include <notchfill/core/configuration.hpp>
#include <notchfill/util/observable.hpp>

#include <toml++/toml.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace app {

inline constexpr const char *kSettingsFile = "notchfill.toml";

// Bounds applied to values loaded from the settings file and edited in the settings UI
inline constexpr double kMinRatioTolerance = 0.0;
inline constexpr double kMaxRatioTolerance = 1.0;
inline constexpr double kMaxHeightSetting = 20.0;

struct SettingsLoadResult {
    enum class Type { Success, TOMLParseError, UnsupportedConfigVersion };

    Type type = Type::Success;
    std::string parseError;
    int configVersion = 0;

    static SettingsLoadResult Success() {
        return {};
    }

    static SettingsLoadResult TOMLParseError(const toml::parse_error &error);

    static SettingsLoadResult UnsupportedConfigVersion(int version) {
        SettingsLoadResult result{};
        result.type = Type::UnsupportedConfigVersion;
        result.configVersion = version;
        return result;
    }

    std::string string() const;

    explicit operator bool() const {
        return type == Type::Success;
    }
};

struct SettingsSaveResult {
    enum class Type { Success, FilesystemError };

    Type type = Type::Success;
    std::error_code error{};

    static SettingsSaveResult Success() {
        return {};
    }

    static SettingsSaveResult FilesystemError(std::error_code error) {
        return {Type::FilesystemError, error};
    }

    std::string string() const;

    explicit operator bool() const {
        return type == Type::Success;
    }
};

struct Settings {
    Settings();

    void ResetToDefaults();

    /// @brief Mirrors the notch settings into the core configuration.
    void BindConfiguration(notchfill::core::Configuration &config);

    SettingsLoadResult Load(const std::filesystem::path &path);
    SettingsSaveResult Save();

    /// @brief Saves the settings if they have been dirty for a while.
    void CheckDirty();

    void MakeDirty();

    // Convenience for ImGui widgets: marks dirty if `value` is true and returns `value`.
    bool MakeDirty(bool value) {
        if (value) {
            MakeDirty();
        }
        return value;
    }

    [[nodiscard]] bool IsDirty() const {
        return m_dirty;
    }

    std::filesystem::path path;

    struct Notch {
        /// Whether the notch filler marker is part of the tab strip.
        util::Observable<bool> enabled;

        util::Observable<std::vector<notchfill::core::config::notch::ScreenRatio>> screenRatios;
        util::Observable<double> ratioTolerance;
        util::Observable<double> fullScreenHeight;
        util::Observable<double> normalHeight;
        util::Observable<double> maxHeight;
    } notch;

    struct Video {
        /// Use the operating system's native fullscreen spaces. Takes effect on restart.
        bool nativeFullScreen;

        bool fullScreen;
        int windowWidth;
        int windowHeight;
    } video;

private:
    bool m_dirty = false;
    std::chrono::steady_clock::time_point m_dirtyTimestamp;
};

} // namespace app
