#include <catch2/catch_test_macros.hpp>

#include <notchfill/notch/height_engine.hpp>

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace height_engine_tests {

using namespace notchfill;
using namespace notchfill::notch;

struct TestWindow final : public host::Window {
    uint64 id = 1;
    uint32 pixelWidth = 1280;
    uint32 pixelHeight = 800;
    uint32 charHeight = 20;
    host::FullScreenState fullScreen = host::FullScreenState::None;
    std::optional<StyleHandle> style{};

    uint64 GetID() const override {
        return id;
    }
    uint32 GetPixelWidth() const override {
        return pixelWidth;
    }
    uint32 GetPixelHeight() const override {
        return pixelHeight;
    }
    uint32 GetCharHeight() const override {
        return charHeight;
    }
    host::FullScreenState GetFullScreenState() const override {
        return fullScreen;
    }
    std::optional<StyleHandle> GetStyleHandle() const override {
        return style;
    }
    void SetStyleHandle(const StyleHandle &handle) override {
        style = handle;
    }
};

struct TestHost final : public host::Host {
    bool graphical = true;
    bool nativeFullScreen = false;
    bool markerInPipeline = true;

    std::map<uint64, double> styleHeights;
    std::vector<StyleHandle> createdStyles;
    size_t heightWrites = 0;

    ResizeChannel resizeChannel;

    bool IsGraphical() const override {
        return graphical;
    }
    bool IsNativeFullScreenEnabled() const override {
        return nativeFullScreen;
    }
    bool IsInTabStripPipeline(std::string_view marker) const override {
        return markerInPipeline && marker == kMarkerName;
    }
    void CreateStyle(const StyleHandle &handle) override {
        createdStyles.push_back(handle);
        styleHeights[handle.id] = 1.0;
    }
    double GetStyleHeight(const StyleHandle &handle) const override {
        return styleHeights.at(handle.id);
    }
    void SetStyleHeight(const StyleHandle &handle, double height) override {
        styleHeights.at(handle.id) = height;
        ++heightWrites;
    }
    ResizeChannel &GetResizeChannel() override {
        return resizeChannel;
    }
};

struct TestSubject {
    core::Configuration config;
    TestHost host;
    HeightEngine engine{host, config};

    // Puts the window in fullscreen on a 14" notched panel
    static void MakeNotchedFullScreen(TestWindow &window) {
        window.pixelWidth = 3024;
        window.pixelHeight = 1964;
        window.fullScreen = host::FullScreenState::FullBoth;
    }

    double StyleHeight(const TestWindow &window) const {
        REQUIRE(window.style.has_value());
        return host.styleHeights.at(window.style->id);
    }
};

TEST_CASE("Windowed height uses the normal height", "[notch][height-engine]") {
    TestSubject subject{};
    TestWindow window{};

    CHECK_FALSE(subject.engine.IsFullScreen(window));
    CHECK(subject.engine.ComputeMultiplier(window) == 1.0);

    subject.config.notch.normalHeight = 2.5;
    CHECK(subject.engine.ComputeMultiplier(window) == 2.5);

    // Below one line is raised to one line
    subject.config.notch.normalHeight = 0.5;
    CHECK(subject.engine.ComputeMultiplier(window) == 1.0);
}

TEST_CASE("Every non-native fullscreen state counts as fullscreen", "[notch][height-engine]") {
    TestSubject subject{};
    TestWindow window{};

    for (auto state : {host::FullScreenState::Maximized, host::FullScreenState::FullBoth,
                       host::FullScreenState::FullWidth, host::FullScreenState::FullHeight}) {
        window.fullScreen = state;
        CAPTURE(static_cast<int>(state));
        CHECK(subject.engine.IsFullScreen(window));
    }

    window.fullScreen = host::FullScreenState::None;
    CHECK_FALSE(subject.engine.IsFullScreen(window));
}

TEST_CASE("Native fullscreen is never treated as fullscreen", "[notch][height-engine]") {
    TestSubject subject{};
    TestWindow window{};
    TestSubject::MakeNotchedFullScreen(window);

    subject.host.nativeFullScreen = true;
    subject.config.notch.normalHeight = 1.5;

    CHECK_FALSE(subject.engine.IsFullScreen(window));
    CHECK(subject.engine.ComputeMultiplier(window) == 1.5);
}

TEST_CASE("Fullscreen on a notched display covers the notch", "[notch][height-engine]") {
    TestSubject subject{};
    TestWindow window{};
    TestSubject::MakeNotchedFullScreen(window);

    // 69 px notch over 20 px lines
    window.charHeight = 20;
    CHECK(subject.engine.NotchHeightPixels(window.pixelWidth, window.pixelHeight) == 69);
    CHECK(subject.engine.ComputeMultiplier(window) == 69.0 / 20.0);

    // Clamped to the maximum
    window.charHeight = 10;
    CHECK(subject.engine.ComputeMultiplier(window) == 5.0);

    // Clamped to one line
    window.charHeight = 100;
    CHECK(subject.engine.ComputeMultiplier(window) == 1.0);
}

TEST_CASE("Fullscreen without a known notch uses the fullscreen height", "[notch][height-engine]") {
    TestSubject subject{};
    TestWindow window{};
    window.pixelWidth = 1920;
    window.pixelHeight = 1080;
    window.fullScreen = host::FullScreenState::FullBoth;

    subject.config.notch.fullScreenHeight = 2.0;
    CHECK(subject.engine.ComputeMultiplier(window) == 2.0);

    subject.config.notch.fullScreenHeight = 9.0;
    CHECK(subject.engine.ComputeMultiplier(window) == 5.0);
}

TEST_CASE("Zero character height falls back to the fullscreen height", "[notch][height-engine]") {
    TestSubject subject{};
    TestWindow window{};
    TestSubject::MakeNotchedFullScreen(window);
    window.charHeight = 0;

    subject.config.notch.fullScreenHeight = 1.75;
    CHECK(subject.engine.ComputeMultiplier(window) == 1.75);
}

TEST_CASE("Minimum height wins over a maximum below one line", "[notch][height-engine]") {
    TestSubject subject{};
    TestWindow window{};

    subject.config.notch.maxHeight = 0.5;
    subject.config.notch.normalHeight = 3.0;
    CHECK(subject.engine.ComputeMultiplier(window) == 1.0);

    TestSubject::MakeNotchedFullScreen(window);
    CHECK(subject.engine.ComputeMultiplier(window) == 1.0);
}

TEST_CASE("Computed heights stay within bounds", "[notch][height-engine]") {
    TestSubject subject{};
    TestWindow window{};
    TestSubject::MakeNotchedFullScreen(window);

    for (uint32 charHeight = 0; charHeight <= 128; ++charHeight) {
        window.charHeight = charHeight;
        const double height = subject.engine.ComputeMultiplier(window);
        CAPTURE(charHeight, height);
        CHECK(height >= kMinHeight);
        CHECK(height <= subject.config.notch.maxHeight.Get());
    }
}

TEST_CASE("Refresh writes the style only when the height changes", "[notch][height-engine]") {
    TestSubject subject{};
    TestWindow window{};

    // Windowed at the default normal height matches the initial style height
    REQUIRE(subject.engine.Refresh(window) == ListenerResult::Keep);
    REQUIRE(window.style.has_value());
    CHECK(subject.host.heightWrites == 0);
    CHECK(subject.StyleHeight(window) == 1.0);

    TestSubject::MakeNotchedFullScreen(window);
    REQUIRE(subject.engine.Refresh(window) == ListenerResult::Keep);
    CHECK(subject.host.heightWrites == 1);
    CHECK(subject.StyleHeight(window) == 69.0 / 20.0);

    // Repeated refreshes with the same geometry are idempotent
    for (int i = 0; i < 5; ++i) {
        REQUIRE(subject.engine.Refresh(window) == ListenerResult::Keep);
    }
    CHECK(subject.host.heightWrites == 1);
    CHECK(subject.StyleHeight(window) == 69.0 / 20.0);

    window.fullScreen = host::FullScreenState::None;
    REQUIRE(subject.engine.Refresh(window) == ListenerResult::Keep);
    CHECK(subject.host.heightWrites == 2);
    CHECK(subject.StyleHeight(window) == 1.0);
}

TEST_CASE("Each window gets its own stable style handle", "[notch][height-engine][style-handle]") {
    TestSubject subject{};
    TestWindow window1{};
    TestWindow window2{};
    window2.id = 2;

    const StyleHandle handle1 = subject.engine.ResolveStyleHandle(window1);
    const StyleHandle handle2 = subject.engine.ResolveStyleHandle(window2);
    CHECK(handle1.id != handle2.id);
    CHECK(handle1.name != handle2.name);
    CHECK(subject.host.createdStyles.size() == 2);

    CHECK(subject.engine.ResolveStyleHandle(window1) == handle1);
    CHECK(subject.engine.ResolveStyleHandle(window2) == handle2);
    CHECK(subject.host.createdStyles.size() == 2);

    // Independent heights per window
    TestSubject::MakeNotchedFullScreen(window1);
    REQUIRE(subject.engine.Refresh(window1) == ListenerResult::Keep);
    REQUIRE(subject.engine.Refresh(window2) == ListenerResult::Keep);
    CHECK(subject.StyleHeight(window1) == 69.0 / 20.0);
    CHECK(subject.StyleHeight(window2) == 1.0);
}

TEST_CASE("Rendering the marker subscribes once", "[notch][height-engine][listener]") {
    TestSubject subject{};
    TestWindow window{};
    auto &channel = subject.host.resizeChannel;

    CHECK_FALSE(subject.engine.IsListening());
    CHECK(channel.GetListenerCount() == 0);

    const MarkerUnit unit = subject.engine.RenderMarker(window);
    CHECK(unit.text == " ");
    REQUIRE(unit.style.has_value());
    CHECK(unit.style == window.style);
    CHECK(subject.engine.IsListening());
    CHECK(channel.GetListenerCount() == 1);

    for (int i = 0; i < 3; ++i) {
        CHECK(subject.engine.RenderMarker(window).style == unit.style);
    }
    CHECK(channel.GetListenerCount() == 1);

    // Resize notifications drive the refresh
    TestSubject::MakeNotchedFullScreen(window);
    CHECK(channel.Notify(window) == 1);
    CHECK(subject.StyleHeight(window) == 69.0 / 20.0);
}

TEST_CASE("Non-graphical displays get a plain marker", "[notch][height-engine][listener]") {
    TestSubject subject{};
    TestWindow window{};
    subject.host.graphical = false;

    const MarkerUnit unit = subject.engine.RenderMarker(window);
    CHECK(unit.text == " ");
    CHECK_FALSE(unit.style.has_value());
    CHECK_FALSE(window.style.has_value());
    CHECK(subject.host.createdStyles.empty());
    CHECK(subject.host.resizeChannel.GetListenerCount() == 0);
    CHECK_FALSE(subject.engine.IsListening());
}

TEST_CASE("Removing the marker detaches the listener for good", "[notch][height-engine][listener]") {
    TestSubject subject{};
    TestWindow window{};
    auto &channel = subject.host.resizeChannel;

    (void)subject.engine.RenderMarker(window);
    REQUIRE(subject.engine.IsListening());
    REQUIRE(subject.engine.GetListenerState() == ListenerState::Active);

    subject.host.markerInPipeline = false;
    TestSubject::MakeNotchedFullScreen(window);
    CHECK(channel.Notify(window) == 1);

    CHECK(subject.engine.GetListenerState() == ListenerState::Removed);
    CHECK_FALSE(subject.engine.IsListening());
    CHECK(channel.GetListenerCount() == 0);
    CHECK(subject.host.heightWrites == 0);

    // No further notifications reach the engine
    CHECK(channel.Notify(window) == 0);
    CHECK(subject.host.heightWrites == 0);

    // Restoring the marker does not resubscribe
    subject.host.markerInPipeline = true;
    (void)subject.engine.RenderMarker(window);
    CHECK(channel.GetListenerCount() == 0);
    CHECK(subject.engine.Refresh(window) == ListenerResult::Unsubscribe);
    CHECK(subject.host.heightWrites == 0);
}

TEST_CASE("Destroying the engine unsubscribes it", "[notch][height-engine][listener]") {
    core::Configuration config{};
    TestHost host{};
    TestWindow window{};

    {
        HeightEngine engine{host, config};
        (void)engine.RenderMarker(window);
        CHECK(host.resizeChannel.GetListenerCount() == 1);
    }
    CHECK(host.resizeChannel.GetListenerCount() == 0);
    CHECK(host.resizeChannel.Notify(window) == 0);
}

TEST_CASE("Direct refresh after marker removal detaches from the channel", "[notch][height-engine][listener]") {
    core::Configuration config{};
    TestHost host{};
    TestWindow window{};
    auto &channel = host.resizeChannel;

    auto engine = std::make_unique<HeightEngine>(host, config);
    (void)engine->RenderMarker(window);
    REQUIRE(channel.GetListenerCount() == 1);

    // The host refreshes on its own instead of going through the channel
    host.markerInPipeline = false;
    CHECK(engine->Refresh(window) == ListenerResult::Unsubscribe);
    CHECK(engine->GetListenerState() == ListenerState::Removed);
    CHECK_FALSE(engine->IsListening());
    CHECK(channel.GetListenerCount() == 0);

    engine.reset();
    CHECK(channel.Notify(window) == 0);
    CHECK(host.heightWrites == 0);
}

} // namespace height_engine_tests
