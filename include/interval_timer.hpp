#ifndef INTERVAL_TIMER_HPP
#define INTERVAL_TIMER_HPP

#include <atomic>
#include <chrono>

#include "system_utils.hpp"

/**
 * @brief Cancellable fixed-interval wait for the poll loop.
 *
 * `wait()` blocks for the full duration unless `cancel()` is called, in
 * which case it returns immediately and every later `wait()` also returns
 * at once. Cancellation writes a byte to an internal pipe, so `cancel()`
 * may be called from a signal handler or another thread.
 */
class IntervalTimer {
  public:
    IntervalTimer();

    IntervalTimer(const IntervalTimer&) = delete;
    IntervalTimer& operator=(const IntervalTimer&) = delete;

    /**
     * @brief Sleep for @p duration.
     *
     * @return `true` when the whole duration elapsed, `false` if the timer
     *         was cancelled.
     */
    bool wait(std::chrono::milliseconds duration);

    /** Async-signal-safe. */
    void cancel() noexcept;

    bool cancelled() const noexcept { return cancelled_.load(); }

  private:
    procutil::UniqueFd wake_r_;
    procutil::UniqueFd wake_w_;
    std::atomic<bool> cancelled_{false};
};

#endif // INTERVAL_TIMER_HPP
