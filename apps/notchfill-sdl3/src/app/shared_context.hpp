#pragma once

#include "sdl_host.hpp"
#include "settings.hpp"

#include <notchfill/core/configuration.hpp>
#include <notchfill/notch/height_engine.hpp>

namespace app {

struct SharedContext {
    Settings settings;
    notchfill::core::Configuration config;
    SDLHost host{settings};
    notchfill::notch::HeightEngine engine{host, config};

    float displayScale = 1.0f;

    // Set when the configuration changes; windows are refreshed on the next frame
    bool refreshPending = true;
};

} // namespace app
