#pragma once

/**
@file
@brief Aspect ratio lookup against the table of known notched displays.
*/

#include <notchfill/core/configuration.hpp>
#include <notchfill/core/types.hpp>

#include <optional>
#include <span>

namespace notchfill::notch {

using core::config::notch::ScreenRatio;

/// @brief Matches screen dimensions against a table of notched display aspect ratios.
///
/// The matcher does not own the table; it must outlive the matcher.
class RatioMatcher {
public:
    RatioMatcher(std::span<const ScreenRatio> table, double tolerance)
        : m_table(table)
        , m_tolerance(tolerance) {}

    /// @brief Finds the first table entry whose ratio is within tolerance of `width / height`.
    /// @param[in] width the screen width in pixels
    /// @param[in] height the screen height in pixels
    /// @return a pointer to the matching entry, or `nullptr` if none matches or `height` is zero
    [[nodiscard]] const ScreenRatio *Find(uint32 width, uint32 height) const;

    /// @brief Computes the notch height in pixels for a screen of the given size.
    /// @param[in] width the screen width in pixels
    /// @param[in] height the screen height in pixels
    /// @return the notch height rounded to the nearest pixel, or 0 if the screen is not a known notched display
    [[nodiscard]] uint32 NotchHeightPixels(uint32 width, uint32 height) const;

private:
    std::span<const ScreenRatio> m_table;
    double m_tolerance;
};

} // namespace notchfill::notch
