#pragma once

#include <atomic>

namespace pysandbox {

/**
 * @brief cancellation flag that can be waited on with poll()
 * Backed by an eventfd which stays readable once cancel() was called, so
 * every executor polling it wakes up. cancel() only performs a write(2)
 * and may be called from a signal handler.
 */
struct cancellation_token {
    /**
     * @throw sandbox_error when the eventfd cannot be created
     */
    cancellation_token();
    ~cancellation_token();

    cancellation_token(const cancellation_token &) = delete;
    cancellation_token &operator=(const cancellation_token &) = delete;

    void cancel() noexcept;

    bool is_cancelled() const noexcept;

    /**
     * @brief descriptor to include in a poll set, becomes readable on cancel
     */
    int fd() const noexcept;

private:
    int efd;
    std::atomic<bool> cancelled;
};

}  // namespace pysandbox
