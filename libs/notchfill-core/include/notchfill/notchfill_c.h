#ifndef NOTCHFILL_NOTCHFILL_C_H
#define NOTCHFILL_NOTCHFILL_C_H

#include <notchfill/export.h>

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct notchfill_handle notchfill_handle_t;

typedef enum notchfill_result {
    NOTCHFILL_RESULT_OK = 0,
    NOTCHFILL_RESULT_INVALID_ARGUMENT = 1,
    NOTCHFILL_RESULT_INTERNAL_ERROR = 2,
    NOTCHFILL_RESULT_DETACHED = 3
} notchfill_result_t;

typedef enum notchfill_log_level {
    NOTCHFILL_LOG_LEVEL_TRACE = 1,
    NOTCHFILL_LOG_LEVEL_DEBUG = 2,
    NOTCHFILL_LOG_LEVEL_INFO = 3,
    NOTCHFILL_LOG_LEVEL_WARN = 4,
    NOTCHFILL_LOG_LEVEL_ERROR = 5
} notchfill_log_level_t;

typedef void (*notchfill_log_callback_t)(void *user_data, notchfill_log_level_t level, const char *message);

typedef enum notchfill_config_flags {
    NOTCHFILL_CONFIG_NATIVE_FULLSCREEN = 1u << 0u,
    NOTCHFILL_CONFIG_EMPTY_RATIO_TABLE = 1u << 1u
} notchfill_config_flags_t;

typedef struct notchfill_config {
    uint32_t struct_size;
    uint32_t flags;
} notchfill_config_t;

#define NOTCHFILL_CONFIG_INIT                                                                                          \
    { sizeof(notchfill_config_t), 0u }

typedef enum notchfill_fullscreen_state {
    NOTCHFILL_FULLSCREEN_NONE = 0,
    NOTCHFILL_FULLSCREEN_MAXIMIZED = 1,
    NOTCHFILL_FULLSCREEN_FULLBOTH = 2,
    NOTCHFILL_FULLSCREEN_FULLWIDTH = 3,
    NOTCHFILL_FULLSCREEN_FULLHEIGHT = 4
} notchfill_fullscreen_state_t;

typedef struct notchfill_window_state {
    uint64_t window_id;
    uint32_t pixel_width;
    uint32_t pixel_height;
    uint32_t char_height;
    uint32_t fullscreen; // one of notchfill_fullscreen_state_t
} notchfill_window_state_t;

NOTCHFILL_CORE_EXPORT notchfill_handle_t *notchfill_create(const notchfill_config_t *config);
NOTCHFILL_CORE_EXPORT void notchfill_destroy(notchfill_handle_t *handle);

// Note: devlog output is global; the most recently set callback receives it.
NOTCHFILL_CORE_EXPORT void notchfill_set_log_callback(notchfill_handle_t *handle, notchfill_log_callback_t callback,
                                                      void *user_data);

NOTCHFILL_CORE_EXPORT const char *notchfill_get_last_error(const notchfill_handle_t *handle);

// Screen ratio table and heights
NOTCHFILL_CORE_EXPORT notchfill_result_t notchfill_clear_screen_ratios(notchfill_handle_t *handle);
NOTCHFILL_CORE_EXPORT notchfill_result_t notchfill_add_screen_ratio(notchfill_handle_t *handle, double ratio,
                                                                    double notch_percent);
NOTCHFILL_CORE_EXPORT notchfill_result_t notchfill_set_ratio_tolerance(notchfill_handle_t *handle, double tolerance);
NOTCHFILL_CORE_EXPORT notchfill_result_t notchfill_set_heights(notchfill_handle_t *handle, double fullscreen_height,
                                                               double normal_height, double max_height);

NOTCHFILL_CORE_EXPORT void notchfill_set_native_fullscreen(notchfill_handle_t *handle, bool enabled);

// Removing the marker detaches the engine permanently: subsequent refreshes return NOTCHFILL_RESULT_DETACHED.
NOTCHFILL_CORE_EXPORT void notchfill_set_marker_enabled(notchfill_handle_t *handle, bool enabled);

// Queries
NOTCHFILL_CORE_EXPORT notchfill_result_t notchfill_notch_height_pixels(const notchfill_handle_t *handle,
                                                                       uint32_t screen_width, uint32_t screen_height,
                                                                       uint32_t *out_pixels);
NOTCHFILL_CORE_EXPORT notchfill_result_t notchfill_compute_multiplier(const notchfill_handle_t *handle,
                                                                      const notchfill_window_state_t *state,
                                                                      double *out_multiplier);

// Applies the computed height to the window's style. out_style_id and out_changed are optional.
NOTCHFILL_CORE_EXPORT notchfill_result_t notchfill_refresh(notchfill_handle_t *handle,
                                                           const notchfill_window_state_t *state, double *out_height,
                                                           uint64_t *out_style_id, bool *out_changed);

// Forgets the style attached to a window that no longer exists.
NOTCHFILL_CORE_EXPORT void notchfill_release_window(notchfill_handle_t *handle, uint64_t window_id);

#ifdef __cplusplus
}
#endif

#endif // NOTCHFILL_NOTCHFILL_C_H
