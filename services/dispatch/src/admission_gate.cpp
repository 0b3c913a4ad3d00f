#include "../include/admission_gate.hpp"
#include <algorithm>
#include <stdexcept>

AdmissionGate::AdmissionGate(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) throw std::invalid_argument("admission gate capacity must be at least 1");
}

void AdmissionGate::acquire() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [&] { return in_use_ < capacity_; });
    ++in_use_;
    peak_ = std::max(peak_, in_use_);
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (in_use_ > 0) --in_use_;
    }
    cv_.notify_one();
}

std::size_t AdmissionGate::in_use() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return in_use_;
}

std::size_t AdmissionGate::peak() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return peak_;
}
