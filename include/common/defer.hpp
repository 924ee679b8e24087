#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = ::coexec::scoped_guard() + [&]

namespace coexec {

/**
 * @brief 在作用域结束时执行清理函数
 * 清理函数抛出的 std::exception 会被记录到日志，不会从析构函数中传播出去
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    ~scoped_guard();

    /**
     * @brief 放弃执行清理函数
     */
    void dismiss();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace coexec
