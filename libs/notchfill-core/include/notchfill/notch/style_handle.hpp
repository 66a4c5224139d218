#pragma once

#include <notchfill/core/types.hpp>

#include <string>

namespace notchfill::notch {

/// @brief Identifies the per-window style resource that controls the tab strip marker height.
struct StyleHandle {
    uint64 id = 0;
    std::string name;

    bool operator==(const StyleHandle &) const = default;
};

/// @brief Allocates a new style handle with a process-wide unique identifier.
///
/// Identifiers start at 1, increase monotonically and are never reused for the lifetime of the process.
StyleHandle AllocateStyleHandle();

/// @brief Builds the style resource name for the given identifier.
std::string StyleHandleName(uint64 id);

} // namespace notchfill::notch
