#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>

// Counting semaphore capping how many tasks run their review phase at once.
class AdmissionGate {
public:
    explicit AdmissionGate(std::size_t capacity);

    void acquire();
    void release();

    std::size_t capacity() const { return capacity_; }
    std::size_t in_use() const;
    // Highest in_use() observed since construction.
    std::size_t peak() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::size_t in_use_{0};
    std::size_t peak_{0};
};

// Holds one slot for its lifetime; released on every exit path.
class GateSlot {
public:
    explicit GateSlot(AdmissionGate& gate) : gate_(gate) { gate_.acquire(); }
    ~GateSlot() { gate_.release(); }
    GateSlot(const GateSlot&) = delete;
    GateSlot& operator=(const GateSlot&) = delete;

private:
    AdmissionGate& gate_;
};
