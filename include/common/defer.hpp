#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = grader::scoped_guard() + [&]

namespace grader {

/**
 * @brief 作用域守卫，离开作用域时执行清理函数
 * 配合 defer 宏使用，保证在异常、提前返回等所有退出路径上都会执行清理
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 放弃执行清理函数
     */
    void dismiss();
};

}  // namespace grader
