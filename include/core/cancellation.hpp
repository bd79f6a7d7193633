#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace joinscout {

/**
 * @brief Cooperative cancellation flag with an optional deadline
 *
 * Owned by the caller of a request and observed by the worker. A token
 * is cancelled once cancel() has been called or its deadline has passed.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    explicit CancellationToken(std::chrono::milliseconds timeout)
        : deadline_(Clock::now() + timeout) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        if (cancelled_.load(std::memory_order_acquire)) {
            return true;
        }
        return deadline_ && Clock::now() >= *deadline_;
    }

    [[nodiscard]] bool has_deadline() const noexcept { return deadline_.has_value(); }

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

} // namespace joinscout
