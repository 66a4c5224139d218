#pragma once

#include <notchfill/core/types.hpp>

namespace app::ui {

/// Model/shared state for the tab strip and the page below it (model-view pattern).
struct TabStripModel {
    enum class Page : uint8 {
        Overview,
        Settings,
    };

    Page selectedPage = Page::Overview;

    // Last height applied to the strip, in text lines
    double lastHeight = 1.0;
};

} // namespace app::ui
