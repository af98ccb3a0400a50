#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_deferred_action) = scoped_guard() + [&]

/**
 * @brief 作用域守卫，在离开作用域时执行清理函数
 * 配合 defer 宏使用：
 * @code{.cpp}
 *     defer { ctx.teardown_nothrow(); };
 * @endcode
 * 清理函数不允许抛出异常，否则析构时会导致 std::terminate。
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};
