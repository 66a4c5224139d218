#include <notchfill/notch/height_engine.hpp>

#include <notchfill/util/dev_log.hpp>

#include <algorithm>
#include <cmath>

namespace notchfill::notch {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // engine
    //   style

    struct engine {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "HeightEngine";
    };

    struct style : public engine {
        static constexpr std::string_view name = "HeightEngine-Style";
    };

} // namespace grp

HeightEngine::HeightEngine(host::Host &host, const core::Configuration &config)
    : m_host(host)
    , m_config(config) {}

HeightEngine::~HeightEngine() {
    if (m_listenerID != kInvalidListenerID) {
        m_host.GetResizeChannel().Unsubscribe(m_listenerID);
    }
}

bool HeightEngine::IsFullScreen(const host::Window &window) const {
    // Native fullscreen already keeps content clear of the notch
    if (m_host.IsNativeFullScreenEnabled()) {
        return false;
    }
    return window.GetFullScreenState() != host::FullScreenState::None;
}

uint32 HeightEngine::NotchHeightPixels(uint32 width, uint32 height) const {
    const auto &screenRatios = m_config.notch.screenRatios.Get();
    const RatioMatcher matcher{screenRatios, m_config.notch.ratioTolerance.Get()};
    return matcher.NotchHeightPixels(width, height);
}

double HeightEngine::ComputeMultiplier(const host::Window &window) const {
    const auto &cfg = m_config.notch;

    double height;
    if (!IsFullScreen(window)) {
        height = cfg.normalHeight.Get();
    } else {
        const uint32 notchHeight = NotchHeightPixels(window.GetPixelWidth(), window.GetPixelHeight());
        const uint32 charHeight = window.GetCharHeight();
        if (notchHeight > 0 && charHeight > 0) {
            height = static_cast<double>(notchHeight) / static_cast<double>(charHeight);
        } else {
            height = cfg.fullScreenHeight.Get();
        }
    }

    // The lower bound wins if the configured maximum is below one line
    return std::max(kMinHeight, std::min(height, cfg.maxHeight.Get()));
}

ListenerResult HeightEngine::Refresh(host::Window &window) {
    if (m_listenerState == ListenerState::Removed) {
        return ListenerResult::Unsubscribe;
    }
    if (!m_host.IsInTabStripPipeline(kMarkerName)) {
        devlog::debug<grp::engine>("Marker removed from the tab strip; detaching resize listener");
        m_listenerState = ListenerState::Removed;

        // Refresh may be called directly rather than from the channel, which would still hold the listener
        if (m_listenerID != kInvalidListenerID) {
            m_host.GetResizeChannel().Unsubscribe(m_listenerID);
            m_listenerID = kInvalidListenerID;
        }
        return ListenerResult::Unsubscribe;
    }

    const StyleHandle handle = ResolveStyleHandle(window);
    const double currHeight = m_host.GetStyleHeight(handle);
    const double newHeight = ComputeMultiplier(window);
    if (std::abs(currHeight - newHeight) > kHeightEpsilon) {
        devlog::debug<grp::style>("Window {}: {} height {:.3f} -> {:.3f}", window.GetID(), handle.name, currHeight,
                                  newHeight);
        m_host.SetStyleHeight(handle, newHeight);
    }
    return ListenerResult::Keep;
}

MarkerUnit HeightEngine::RenderMarker(host::Window &window) {
    if (!m_host.IsGraphical()) {
        return {" ", std::nullopt};
    }

    if (!m_listenerRegistered) {
        m_listenerID = m_host.GetResizeChannel().Subscribe({this, &HeightEngine::OnWindowResized});
        m_listenerRegistered = true;
        devlog::debug<grp::engine>("Subscribed to resize notifications");
    }

    return {" ", ResolveStyleHandle(window)};
}

StyleHandle HeightEngine::ResolveStyleHandle(host::Window &window) {
    if (auto handle = window.GetStyleHandle()) {
        return *handle;
    }

    StyleHandle handle = AllocateStyleHandle();
    m_host.CreateStyle(handle);
    window.SetStyleHandle(handle);
    devlog::debug<grp::style>("Window {}: created style {}", window.GetID(), handle.name);
    return handle;
}

bool HeightEngine::IsListening() const {
    return m_listenerID != kInvalidListenerID && m_host.GetResizeChannel().IsSubscribed(m_listenerID);
}

ListenerResult HeightEngine::OnWindowResized(host::Window &window, void *ctx) {
    return static_cast<HeightEngine *>(ctx)->Refresh(window);
}

} // namespace notchfill::notch
