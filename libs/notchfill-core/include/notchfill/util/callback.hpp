#pragma once

/**
@file
@brief Lightweight context + function pointer callbacks.

A callback binds a plain function pointer to an opaque context pointer, which is passed as the last argument:

```cpp
void OnResized(notchfill::host::Window &window, void *ctx);
notch::CBWindowResized cb{this, &OnResized};
```
*/

namespace util {

template <typename>
class RequiredCallback;

/// @brief A callback that must be bound before it is invoked.
template <typename R, typename... Args>
class RequiredCallback<R(Args...)> {
public:
    using FnType = R (*)(Args..., void *ctx);

    RequiredCallback(void *ctx, FnType fn)
        : m_ctx(ctx)
        , m_fn(fn) {}

    R operator()(Args... args) const {
        return m_fn(args..., m_ctx);
    }

private:
    void *m_ctx;
    FnType m_fn;
};

} // namespace util
