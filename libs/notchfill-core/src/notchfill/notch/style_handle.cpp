#include <notchfill/notch/style_handle.hpp>

#include <fmt/format.h>

#include <atomic>

namespace notchfill::notch {

static std::atomic<uint64> g_nextStyleHandleID{1};

StyleHandle AllocateStyleHandle() {
    const uint64 id = g_nextStyleHandleID.fetch_add(1, std::memory_order_relaxed);
    return {id, StyleHandleName(id)};
}

std::string StyleHandleName(uint64 id) {
    return fmt::format("notchfill-tab-strip-{}", id);
}

} // namespace notchfill::notch
