#include <notchfill/core/configuration.hpp>

namespace notchfill::core {

namespace config::notch {

    std::vector<ScreenRatio> DefaultScreenRatios() {
        return {
            {1.539, 3.513}, // 3024x1964
            {1.547, 3.088}, // 3456x2234
        };
    }

} // namespace config::notch

void Configuration::NotifyObservers() {
    notch.screenRatios.Notify();
    notch.ratioTolerance.Notify();
    notch.fullScreenHeight.Notify();
    notch.normalHeight.Notify();
    notch.maxHeight.Notify();
}

} // namespace notchfill::core
