/**
 * @file cancellation_token.h
 * @brief Shared cooperative cancellation signal
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_CANCELLATION_TOKEN_H
#define KCENON_CHUNKED_UPLOAD_CORE_CANCELLATION_TOKEN_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief One-shot cancellation flag that sleeping waiters can observe
 *
 * Once cancelled a token stays cancelled. Callbacks registered before
 * cancellation run exactly once, on the cancelling thread; callbacks
 * registered afterwards run immediately.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    cancellation_token(const cancellation_token&) = delete;
    auto operator=(const cancellation_token&) -> cancellation_token& = delete;

    void cancel() {
        std::vector<std::function<void()>> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_.exchange(true)) {
                return;
            }
            callbacks.swap(callbacks_);
        }
        cv_.notify_all();
        for (auto& cb : callbacks) {
            cb();
        }
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep for the given duration unless cancelled first
     * @return true if the full duration elapsed, false if cancelled
     */
    [[nodiscard]] auto sleep_for(std::chrono::milliseconds duration) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    }

    void on_cancel(std::function<void()> callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_.load()) {
                callbacks_.push_back(std::move(callback));
                return;
            }
        }
        callback();
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::function<void()>> callbacks_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_CANCELLATION_TOKEN_H
