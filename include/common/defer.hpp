#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * 在当前作用域退出时执行代码块，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     auto handle = launcher.launch(...);
 *     defer { handle.release(); };
 * @endcode
 */
#define defer auto DEFER_0(_deferred_action) = coderun::scope_exit() + [&]

namespace coderun {

struct scope_exit {
    scope_exit();
    explicit scope_exit(std::function<void()> action);
    scope_exit(scope_exit &&other);
    scope_exit(const scope_exit &) = delete;
    ~scope_exit();

    scope_exit operator+(std::function<void()> action) const;

private:
    std::function<void()> action;
};

}  // namespace coderun
