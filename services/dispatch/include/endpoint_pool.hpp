#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Equivalent chat-completion endpoints handed out in round-robin order.
// One pool per run; safe to share by reference between tasks.
class EndpointPool {
public:
    // An explicit list wins (order kept, duplicates allowed); otherwise the
    // legacy single url is used; otherwise the pool is empty.
    EndpointPool(std::vector<std::string> endpoints, std::string fallback_url);

    const std::vector<std::string>& effective_endpoints() const { return effective_; }
    std::size_t size() const { return effective_.size(); }

    // Rotation offset in [0, size()). Every call consumes exactly one tick.
    std::size_t next_start_index();

    std::uint64_t ticks() const { return counter_.load(); }

private:
    std::vector<std::string> effective_;
    std::atomic<std::uint64_t> counter_{0};
};
