#pragma once

/**
@file
@brief Runtime configuration for the notch filler.
*/

#include <notchfill/util/observable.hpp>

#include <vector>

namespace notchfill::core {

namespace config::notch {

    /// @brief A known notched display, identified by its width/height aspect ratio.
    struct ScreenRatio {
        double ratio;        ///< Width divided by height
        double notchPercent; ///< Height of the notch as a percentage of the display height, in [0, 100]

        bool operator==(const ScreenRatio &) const = default;
    };

    /// @brief The built-in table: 14" and 16" notched laptop panels.
    std::vector<ScreenRatio> DefaultScreenRatios();

    inline constexpr double kDefaultRatioTolerance = 0.001;
    inline constexpr double kDefaultFullScreenHeight = 1.0;
    inline constexpr double kDefaultNormalHeight = 1.0;
    inline constexpr double kDefaultMaxHeight = 5.0;

} // namespace config::notch

/// @brief Configuration consumed by the height engine.
///
/// Every value is observable. Hosts observe them to refresh windows when the configuration changes.
struct Configuration {
    struct Notch {
        /// Known notched displays, scanned in order.
        util::Observable<std::vector<config::notch::ScreenRatio>> screenRatios{config::notch::DefaultScreenRatios()};

        /// Maximum absolute difference between a window's aspect ratio and a table entry to count as a match.
        util::Observable<double> ratioTolerance{config::notch::kDefaultRatioTolerance};

        /// Height multiplier used in fullscreen when no table entry matches.
        util::Observable<double> fullScreenHeight{config::notch::kDefaultFullScreenHeight};

        /// Height multiplier used outside of fullscreen.
        util::Observable<double> normalHeight{config::notch::kDefaultNormalHeight};

        /// Upper bound for any computed height multiplier.
        util::Observable<double> maxHeight{config::notch::kDefaultMaxHeight};
    } notch;

    /// @brief Notifies all observers with the current values.
    void NotifyObservers();
};

} // namespace notchfill::core
