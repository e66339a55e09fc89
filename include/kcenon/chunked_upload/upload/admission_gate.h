/**
 * @file admission_gate.h
 * @brief Counting admission gate bounding in-flight chunks
 */

#ifndef KCENON_CHUNKED_UPLOAD_UPLOAD_ADMISSION_GATE_H
#define KCENON_CHUNKED_UPLOAD_UPLOAD_ADMISSION_GATE_H

#include "kcenon/chunked_upload/core/types.h"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace kcenon::chunked_upload {

/**
 * @brief Semaphore with RAII permits and an interrupt switch
 *
 * acquire() blocks while all permits are out. interrupt() wakes every
 * waiter and makes further acquire() calls fail with operation_cancelled;
 * permits already handed out stay valid and are returned normally.
 */
class admission_gate {
public:
    /**
     * @brief A held slot; released on destruction
     */
    class permit {
    public:
        permit(permit&& other) noexcept;
        auto operator=(permit&& other) noexcept -> permit&;
        ~permit();

        permit(const permit&) = delete;
        auto operator=(const permit&) -> permit& = delete;

        /**
         * @brief Return the slot early. Idempotent.
         */
        void release();

        [[nodiscard]] auto is_held() const noexcept -> bool { return gate_ != nullptr; }

    private:
        friend class admission_gate;
        explicit permit(admission_gate* gate) : gate_(gate) {}

        admission_gate* gate_;
    };

    explicit admission_gate(std::size_t capacity);

    admission_gate(const admission_gate&) = delete;
    auto operator=(const admission_gate&) -> admission_gate& = delete;

    /**
     * @brief Block until a slot is free
     * @return Permit, or operation_cancelled once interrupted
     */
    [[nodiscard]] auto acquire() -> result<permit>;

    /**
     * @brief Take a slot only if one is free right now
     */
    [[nodiscard]] auto try_acquire() -> std::optional<permit>;

    /**
     * @brief Stop admitting and wake all waiters
     */
    void interrupt();

    [[nodiscard]] auto is_interrupted() const -> bool;

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

    [[nodiscard]] auto in_use() const -> std::size_t;

    /**
     * @brief Highest number of simultaneously held permits observed
     */
    [[nodiscard]] auto peak_in_use() const -> std::size_t;

private:
    void give_back();

    const std::size_t capacity_;
    std::size_t in_use_ = 0;
    std::size_t peak_in_use_ = 0;
    bool interrupted_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_UPLOAD_ADMISSION_GATE_H
