#include "interval_timer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <unistd.h>

IntervalTimer::IntervalTimer() {
    if (!procutil::make_pipe(wake_r_, wake_w_) || !procutil::set_nonblocking(wake_r_.get()) ||
        !procutil::set_nonblocking(wake_w_.get()))
        throw std::runtime_error(std::string("Failed to create timer pipe: ") +
                                 std::strerror(errno));
}

bool IntervalTimer::wait(std::chrono::milliseconds duration) {
    using clock = std::chrono::steady_clock;
    // Keeps now() + duration within the nanosecond range of steady_clock.
    constexpr std::chrono::milliseconds max_wait = std::chrono::hours(24 * 365 * 100);
    const auto deadline = clock::now() + std::min(duration, max_wait);
    while (!cancelled_.load()) {
        auto now = clock::now();
        if (now >= deadline)
            return true;
        auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        pollfd pfd{wake_r_.get(), POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(std::min<long long>(left.count(), 60 * 1000)));
        if (rc < 0 && errno != EINTR)
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
    }
    return false;
}

void IntervalTimer::cancel() noexcept {
    cancelled_.store(true);
    const char b = 1;
    ssize_t r = write(wake_w_.get(), &b, 1);
    (void)r; // pipe full means a wakeup is already pending
}
