#include <catch2/catch_test_macros.hpp>

#include <notchfill/notchfill_c.h>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace notchfill_c_tests {

struct LogCapture {
    struct Entry {
        notchfill_log_level_t level;
        std::string message;
    };
    std::vector<Entry> entries;

    static void Callback(void *userData, notchfill_log_level_t level, const char *message) {
        static_cast<LogCapture *>(userData)->entries.push_back({level, message});
    }

    size_t CountLevel(notchfill_log_level_t level) const {
        size_t count = 0;
        for (const Entry &entry : entries) {
            if (entry.level == level) {
                ++count;
            }
        }
        return count;
    }
};

struct TestSubject {
    notchfill_handle_t *handle;

    explicit TestSubject(const notchfill_config_t *config = nullptr)
        : handle(notchfill_create(config)) {
        REQUIRE(handle != nullptr);
    }

    ~TestSubject() {
        notchfill_destroy(handle);
    }

    TestSubject(const TestSubject &) = delete;
    TestSubject &operator=(const TestSubject &) = delete;
};

notchfill_window_state_t NotchedFullScreen(uint64_t windowID) {
    return {windowID, 3024, 1964, 20, NOTCHFILL_FULLSCREEN_FULLBOTH};
}

TEST_CASE("C API rejects invalid configuration structs", "[c-api]") {
    notchfill_config_t config = NOTCHFILL_CONFIG_INIT;
    config.struct_size = 0;
    CHECK(notchfill_create(&config) == nullptr);

    notchfill_destroy(nullptr);
    CHECK(std::string{notchfill_get_last_error(nullptr)} == "Invalid handle");
}

TEST_CASE("C API computes notch heights with the default table", "[c-api]") {
    TestSubject subject{};

    uint32_t pixels = 123;
    REQUIRE(notchfill_notch_height_pixels(subject.handle, 3024, 1964, &pixels) == NOTCHFILL_RESULT_OK);
    CHECK(pixels == 69);
    REQUIRE(notchfill_notch_height_pixels(subject.handle, 1920, 1080, &pixels) == NOTCHFILL_RESULT_OK);
    CHECK(pixels == 0);

    CHECK(notchfill_notch_height_pixels(subject.handle, 3024, 0, &pixels) == NOTCHFILL_RESULT_INVALID_ARGUMENT);
    CHECK(notchfill_notch_height_pixels(subject.handle, 3024, 1964, nullptr) == NOTCHFILL_RESULT_INVALID_ARGUMENT);
}

TEST_CASE("C API edits the screen ratio table", "[c-api]") {
    notchfill_config_t config = NOTCHFILL_CONFIG_INIT;
    config.flags = NOTCHFILL_CONFIG_EMPTY_RATIO_TABLE;
    TestSubject subject{&config};

    uint32_t pixels = 0;
    REQUIRE(notchfill_notch_height_pixels(subject.handle, 3024, 1964, &pixels) == NOTCHFILL_RESULT_OK);
    CHECK(pixels == 0);

    REQUIRE(notchfill_add_screen_ratio(subject.handle, 2.0, 10.0) == NOTCHFILL_RESULT_OK);
    REQUIRE(notchfill_notch_height_pixels(subject.handle, 2000, 1000, &pixels) == NOTCHFILL_RESULT_OK);
    CHECK(pixels == 100);

    CHECK(notchfill_add_screen_ratio(subject.handle, 0.0, 10.0) == NOTCHFILL_RESULT_INVALID_ARGUMENT);
    CHECK_FALSE(std::string{notchfill_get_last_error(subject.handle)}.empty());
    CHECK(notchfill_add_screen_ratio(subject.handle, 1.5, 101.0) == NOTCHFILL_RESULT_INVALID_ARGUMENT);
    CHECK(notchfill_add_screen_ratio(subject.handle, 1.5, -1.0) == NOTCHFILL_RESULT_INVALID_ARGUMENT);

    REQUIRE(notchfill_clear_screen_ratios(subject.handle) == NOTCHFILL_RESULT_OK);
    CHECK(std::string{notchfill_get_last_error(subject.handle)}.empty());
    REQUIRE(notchfill_notch_height_pixels(subject.handle, 2000, 1000, &pixels) == NOTCHFILL_RESULT_OK);
    CHECK(pixels == 0);
}

TEST_CASE("C API validates tolerance and heights", "[c-api]") {
    TestSubject subject{};

    CHECK(notchfill_set_ratio_tolerance(subject.handle, -0.1) == NOTCHFILL_RESULT_INVALID_ARGUMENT);
    CHECK(notchfill_set_ratio_tolerance(subject.handle, 0.01) == NOTCHFILL_RESULT_OK);

    CHECK(notchfill_set_heights(subject.handle, 1.0, 1.0, 0.5) == NOTCHFILL_RESULT_INVALID_ARGUMENT);
    CHECK(notchfill_set_heights(subject.handle, 2.0, 1.5, 3.0) == NOTCHFILL_RESULT_OK);

    notchfill_window_state_t state{1, 1920, 1080, 20, NOTCHFILL_FULLSCREEN_NONE};
    double multiplier = 0.0;
    REQUIRE(notchfill_compute_multiplier(subject.handle, &state, &multiplier) == NOTCHFILL_RESULT_OK);
    CHECK(multiplier == 1.5);

    state.fullscreen = NOTCHFILL_FULLSCREEN_MAXIMIZED;
    REQUIRE(notchfill_compute_multiplier(subject.handle, &state, &multiplier) == NOTCHFILL_RESULT_OK);
    CHECK(multiplier == 2.0);

    // Notch of 69 px over 10 px lines exceeds the maximum
    state = NotchedFullScreen(1);
    state.char_height = 10;
    REQUIRE(notchfill_compute_multiplier(subject.handle, &state, &multiplier) == NOTCHFILL_RESULT_OK);
    CHECK(multiplier == 3.0);

    notchfill_set_native_fullscreen(subject.handle, true);
    REQUIRE(notchfill_compute_multiplier(subject.handle, &state, &multiplier) == NOTCHFILL_RESULT_OK);
    CHECK(multiplier == 1.5);

    CHECK(notchfill_compute_multiplier(subject.handle, nullptr, &multiplier) == NOTCHFILL_RESULT_INVALID_ARGUMENT);
    CHECK(notchfill_compute_multiplier(subject.handle, &state, nullptr) == NOTCHFILL_RESULT_INVALID_ARGUMENT);
}

TEST_CASE("C API refresh applies heights once per change", "[c-api]") {
    TestSubject subject{};

    notchfill_window_state_t state = NotchedFullScreen(10);
    double height = 0.0;
    uint64_t styleID = 0;
    bool changed = false;

    REQUIRE(notchfill_refresh(subject.handle, &state, &height, &styleID, &changed) == NOTCHFILL_RESULT_OK);
    CHECK(height == 69.0 / 20.0);
    CHECK(styleID != 0);
    CHECK(changed);

    const uint64_t firstStyleID = styleID;
    REQUIRE(notchfill_refresh(subject.handle, &state, &height, &styleID, &changed) == NOTCHFILL_RESULT_OK);
    CHECK(height == 69.0 / 20.0);
    CHECK(styleID == firstStyleID);
    CHECK_FALSE(changed);

    // Another window gets its own style
    notchfill_window_state_t other{11, 1280, 800, 20, NOTCHFILL_FULLSCREEN_NONE};
    REQUIRE(notchfill_refresh(subject.handle, &other, &height, &styleID, &changed) == NOTCHFILL_RESULT_OK);
    CHECK(height == 1.0);
    CHECK(styleID != firstStyleID);
    CHECK_FALSE(changed);

    // Released windows start over with a fresh style
    notchfill_release_window(subject.handle, 10);
    REQUIRE(notchfill_refresh(subject.handle, &state, &height, &styleID, &changed) == NOTCHFILL_RESULT_OK);
    CHECK(styleID != firstStyleID);
    CHECK(changed);

    // Optional outputs
    CHECK(notchfill_refresh(subject.handle, &state, nullptr, nullptr, nullptr) == NOTCHFILL_RESULT_OK);
}

TEST_CASE("C API refresh detaches once the marker is removed", "[c-api]") {
    TestSubject subject{};
    LogCapture logs{};
    notchfill_set_log_callback(subject.handle, &LogCapture::Callback, &logs);

    notchfill_window_state_t state = NotchedFullScreen(1);
    REQUIRE(notchfill_refresh(subject.handle, &state, nullptr, nullptr, nullptr) == NOTCHFILL_RESULT_OK);

    notchfill_set_marker_enabled(subject.handle, false);
    CHECK(notchfill_refresh(subject.handle, &state, nullptr, nullptr, nullptr) == NOTCHFILL_RESULT_DETACHED);
    CHECK_FALSE(std::string{notchfill_get_last_error(subject.handle)}.empty());
    CHECK(logs.CountLevel(NOTCHFILL_LOG_LEVEL_INFO) == 1);

    // Removal is permanent, and repeated refreshes are reported quietly
    notchfill_set_marker_enabled(subject.handle, true);
    for (int i = 0; i < 10; ++i) {
        CHECK(notchfill_refresh(subject.handle, &state, nullptr, nullptr, nullptr) == NOTCHFILL_RESULT_DETACHED);
    }
    CHECK_FALSE(std::string{notchfill_get_last_error(subject.handle)}.empty());
    CHECK(logs.CountLevel(NOTCHFILL_LOG_LEVEL_INFO) == 1);
    CHECK(logs.CountLevel(NOTCHFILL_LOG_LEVEL_ERROR) == 0);

    notchfill_set_log_callback(subject.handle, nullptr, nullptr);
}

TEST_CASE("C API rejects invalid window states", "[c-api]") {
    TestSubject subject{};

    CHECK(notchfill_refresh(subject.handle, nullptr, nullptr, nullptr, nullptr) == NOTCHFILL_RESULT_INVALID_ARGUMENT);

    notchfill_window_state_t state = NotchedFullScreen(1);
    for (uint32_t fullscreen : {5u, 42u, 0xFFFFFFFFu}) {
        CAPTURE(fullscreen);
        state.fullscreen = fullscreen;
        double multiplier = 0.0;
        CHECK(notchfill_refresh(subject.handle, &state, nullptr, nullptr, nullptr) ==
              NOTCHFILL_RESULT_INVALID_ARGUMENT);
        CHECK(std::string{notchfill_get_last_error(subject.handle)} == "Invalid window state");
        CHECK(notchfill_compute_multiplier(subject.handle, &state, &multiplier) == NOTCHFILL_RESULT_INVALID_ARGUMENT);
    }
}

} // namespace notchfill_c_tests
