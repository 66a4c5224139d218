#pragma once

#include <app/shared_context.hpp>

namespace app::ui::widgets {

namespace settings::notch {

    void MarkerEnabled(SharedContext &ctx);
    void Heights(SharedContext &ctx);
    void RatioTolerance(SharedContext &ctx);
    void ScreenRatioTable(SharedContext &ctx);

} // namespace settings::notch

namespace settings::video {

    void NativeFullScreen(SharedContext &ctx);

} // namespace settings::video

} // namespace app::ui::widgets
