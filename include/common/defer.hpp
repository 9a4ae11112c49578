#pragma once

#include <functional>

#define ARENA_DEFER_1(x, y) x##y
#define ARENA_DEFER_2(x, y) ARENA_DEFER_1(x, y)
#define ARENA_DEFER_0(x) ARENA_DEFER_2(x, __COUNTER__)
#define defer auto ARENA_DEFER_0(_defered_option) = arena::scoped_guard() + [&]

namespace arena {

/**
 * @brief 离开作用域时执行 f，用于保证清理代码在所有退出路径上都会执行
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace arena
