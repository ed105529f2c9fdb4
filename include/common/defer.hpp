#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 在当前作用域结束时执行一段代码
 * @code{.cpp}
 *     auto ctx = create_context();
 *     defer { destroy_context(ctx); };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = scoped_guard() + [&]()

/**
 * @brief 作用域守卫，析构时执行回调
 * 回调抛出的异常会被记录后丢弃，因为析构函数不能抛出异常，
 * 并且 defer 的代码一般是清理工作，清理失败不应该掩盖原本的错误
 */
struct scoped_guard {
    scoped_guard() = default;
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;
    ~scoped_guard();

    /**
     * @brief 取消执行回调
     */
    void dismiss();

    scoped_guard operator+(std::function<void()> f) const;

private:
    std::function<void()> f;
};
