#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = ::atst::scoped_guard() + [&]

namespace atst {

/**
 * @brief 在作用域结束时执行清理函数
 * 无论是正常返回还是抛出异常都会执行，用于清理临时文件夹、杀死子进程组
 * @code{.cpp}
 *     int fd = open(...);
 *     defer { close(fd); };
 * @endcode
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace atst
