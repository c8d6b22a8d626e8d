#pragma once

#include <functional>

#define PYSANDBOX_DEFER_1(x, y) x##y
#define PYSANDBOX_DEFER_2(x, y) PYSANDBOX_DEFER_1(x, y)
#define PYSANDBOX_DEFER_0(x) PYSANDBOX_DEFER_2(x, __COUNTER__)
#define defer auto PYSANDBOX_DEFER_0(_deferred_option) = ::pysandbox::scoped_guard() + [&]

namespace pysandbox {

/**
 * @brief runs a callback when leaving the scope, on every path
 * Used by the supervisor to release pipes and reap children even
 * when a step throws halfway.
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace pysandbox
