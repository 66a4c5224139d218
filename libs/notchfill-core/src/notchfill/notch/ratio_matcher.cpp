#include <notchfill/notch/ratio_matcher.hpp>

#include <cmath>

namespace notchfill::notch {

const ScreenRatio *RatioMatcher::Find(uint32 width, uint32 height) const {
    if (height == 0) {
        return nullptr;
    }

    const double ratio = static_cast<double>(width) / static_cast<double>(height);
    for (const ScreenRatio &entry : m_table) {
        if (std::abs(entry.ratio - ratio) <= m_tolerance) {
            return &entry;
        }
    }
    return nullptr;
}

uint32 RatioMatcher::NotchHeightPixels(uint32 width, uint32 height) const {
    const ScreenRatio *entry = Find(width, height);
    if (entry == nullptr) {
        return 0;
    }
    return static_cast<uint32>(std::lround(static_cast<double>(height) * entry->notchPercent / 100.0));
}

} // namespace notchfill::notch
