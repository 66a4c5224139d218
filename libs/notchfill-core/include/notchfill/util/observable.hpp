#pragma once

#include <functional>
#include <utility>
#include <vector>

namespace util {

/// @brief A value that notifies its observers whenever it is assigned.
template <typename T>
class Observable {
public:
    using Observer = std::function<void(const T &)>;

    Observable() = default;
    Observable(T value)
        : m_value(std::move(value)) {}

    Observable(const Observable &) = delete;
    Observable &operator=(const Observable &) = delete;

    Observable &operator=(T value) {
        Set(std::move(value));
        return *this;
    }

    void Set(T value) {
        m_value = std::move(value);
        Notify();
    }

    const T &Get() const {
        return m_value;
    }

    operator const T &() const {
        return m_value;
    }

    /// @brief Adds an observer. The observer is not invoked until the next assignment or `Notify()`.
    void Observe(Observer observer) {
        m_observers.push_back(std::move(observer));
    }

    /// @brief Mirrors this value into `target`.
    void Observe(T &target) {
        Observe([&target](const T &value) { target = value; });
    }

    /// @brief Forwards this value to another observable, which in turn notifies its own observers.
    void Observe(Observable &target) {
        Observe([&target](const T &value) { target = value; });
    }

    /// @brief Pushes the current value to all observers.
    void Notify() const {
        for (const auto &observer : m_observers) {
            observer(m_value);
        }
    }

private:
    T m_value{};
    std::vector<Observer> m_observers;
};

} // namespace util
