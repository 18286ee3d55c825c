#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = arbiter::scoped_guard() + [&]

namespace arbiter {

/**
 * @brief 在作用域结束时执行回调
 * 配合 defer 宏使用，无论是正常返回还是抛出异常都会执行回调，
 * 用于释放沙箱资源、上报监控信息等必须执行的收尾工作。
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace arbiter
