#include <notchfill/notch/resize_channel.hpp>

#include <algorithm>

namespace notchfill::notch {

ListenerID ResizeChannel::Subscribe(CBWindowResized callback) {
    const ListenerID id = m_nextID++;
    m_listeners.push_back({id, callback, false});
    return id;
}

bool ResizeChannel::Unsubscribe(ListenerID id) {
    auto it = std::find_if(m_listeners.begin(), m_listeners.end(),
                           [&](const Listener &listener) { return listener.id == id && !listener.removed; });
    if (it == m_listeners.end()) {
        return false;
    }
    it->removed = true;
    if (!m_notifying) {
        Compact();
    }
    return true;
}

bool ResizeChannel::IsSubscribed(ListenerID id) const {
    return std::any_of(m_listeners.begin(), m_listeners.end(),
                       [&](const Listener &listener) { return listener.id == id && !listener.removed; });
}

size_t ResizeChannel::GetListenerCount() const {
    return std::count_if(m_listeners.begin(), m_listeners.end(),
                         [](const Listener &listener) { return !listener.removed; });
}

size_t ResizeChannel::Notify(host::Window &window) {
    const bool prevNotifying = m_notifying;
    m_notifying = true;

    // Listeners subscribed from within a callback are appended past this point and wait for the next notification
    const size_t count = m_listeners.size();
    size_t invoked = 0;
    for (size_t i = 0; i < count; ++i) {
        if (m_listeners[i].removed) {
            continue;
        }
        const CBWindowResized callback = m_listeners[i].callback;
        ++invoked;
        if (callback(window) == ListenerResult::Unsubscribe) {
            m_listeners[i].removed = true;
        }
    }

    m_notifying = prevNotifying;
    if (!m_notifying) {
        Compact();
    }
    return invoked;
}

void ResizeChannel::Compact() {
    std::erase_if(m_listeners, [](const Listener &listener) { return listener.removed; });
}

} // namespace notchfill::notch
