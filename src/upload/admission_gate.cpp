/**
 * @file admission_gate.cpp
 * @brief Counting admission gate implementation
 */

#include "kcenon/chunked_upload/upload/admission_gate.h"

#include <algorithm>

namespace kcenon::chunked_upload {

// permit implementation

admission_gate::permit::permit(permit&& other) noexcept : gate_(other.gate_) {
    other.gate_ = nullptr;
}

auto admission_gate::permit::operator=(permit&& other) noexcept -> permit& {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

admission_gate::permit::~permit() {
    release();
}

void admission_gate::permit::release() {
    if (gate_) {
        gate_->give_back();
        gate_ = nullptr;
    }
}

// admission_gate implementation

admission_gate::admission_gate(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

auto admission_gate::acquire() -> result<permit> {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return interrupted_ || in_use_ < capacity_; });

    if (interrupted_) {
        return unexpected{error{error_code::operation_cancelled,
            "admission gate interrupted"}};
    }

    ++in_use_;
    peak_in_use_ = std::max(peak_in_use_, in_use_);
    return permit(this);
}

auto admission_gate::try_acquire() -> std::optional<permit> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (interrupted_ || in_use_ >= capacity_) {
        return std::nullopt;
    }

    ++in_use_;
    peak_in_use_ = std::max(peak_in_use_, in_use_);
    return permit(this);
}

void admission_gate::interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
    }
    cv_.notify_all();
}

auto admission_gate::is_interrupted() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return interrupted_;
}

auto admission_gate::in_use() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

auto admission_gate::peak_in_use() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_in_use_;
}

void admission_gate::give_back() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

}  // namespace kcenon::chunked_upload
