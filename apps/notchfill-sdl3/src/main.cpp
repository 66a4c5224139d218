#include <app/app.hpp>

#include <notchfill/util/dev_log.hpp>

#include <SDL3/SDL_main.h>

#include <cstdlib>
#include <exception>
#include <filesystem>

namespace grp {

struct base {
    static constexpr bool enabled = true;
    static constexpr devlog::Level level = devlog::level::info;
    static constexpr std::string_view name = "Main";
};

} // namespace grp

int main(int argc, char **argv) {
    std::filesystem::path settingsPath = app::kSettingsFile;
    if (argc > 1) {
        settingsPath = argv[1];
    }

    try {
        app::App app{};
        return app.Run(settingsPath);
    } catch (const std::exception &e) {
        devlog::error<grp::base>("Unhandled exception: {}", e.what());
        return EXIT_FAILURE;
    }
}
