#pragma once

/**
@file
@brief Window resize notification channel.
*/

#include <notchfill/host/window.hpp>

#include <notchfill/util/callback.hpp>

#include <notchfill/core/types.hpp>

#include <vector>

namespace notchfill::notch {

/// @brief Returned by resize listeners to tell the channel whether to keep them subscribed.
enum class ListenerResult : uint8 {
    Keep,
    Unsubscribe,
};

/// @brief Invoked when a window is resized or redrawn.
using CBWindowResized = util::RequiredCallback<ListenerResult(host::Window &window)>;

using ListenerID = uint64;

inline constexpr ListenerID kInvalidListenerID = 0;

/// @brief Dispatches resize notifications to subscribed listeners.
///
/// Listeners may unsubscribe themselves by returning `ListenerResult::Unsubscribe`. Listeners added or removed during
/// a notification take effect on the next notification.
class ResizeChannel {
public:
    ListenerID Subscribe(CBWindowResized callback);

    /// @brief Removes a listener.
    /// @return `true` if the listener was subscribed
    bool Unsubscribe(ListenerID id);

    [[nodiscard]] bool IsSubscribed(ListenerID id) const;

    [[nodiscard]] size_t GetListenerCount() const;

    /// @brief Notifies all listeners that `window` was resized.
    /// @return the number of listeners invoked
    size_t Notify(host::Window &window);

private:
    struct Listener {
        ListenerID id;
        CBWindowResized callback;
        bool removed;
    };

    std::vector<Listener> m_listeners;
    ListenerID m_nextID = 1;
    bool m_notifying = false;

    void Compact();
};

} // namespace notchfill::notch
