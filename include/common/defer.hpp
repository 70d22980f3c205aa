#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = grader::scoped_guard() + [&]

namespace grader {

/**
 * @brief 在离开作用域时执行清理函数
 * 通常通过 defer 宏使用：
 * @code{.cpp}
 *     defer { std::filesystem::remove_all(dir); };
 * @endcode
 */
struct scoped_guard {
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

private:
    std::function<void()> f;
};

}  // namespace grader
