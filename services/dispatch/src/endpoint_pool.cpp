#include "../include/endpoint_pool.hpp"
#include <utility>

EndpointPool::EndpointPool(std::vector<std::string> endpoints, std::string fallback_url) {
    if (!endpoints.empty()) {
        effective_ = std::move(endpoints);
    } else if (!fallback_url.empty()) {
        effective_.push_back(std::move(fallback_url));
    }
}

std::size_t EndpointPool::next_start_index() {
    std::uint64_t ticket = counter_.fetch_add(1) + 1;
    if (effective_.empty()) return 0;
    return static_cast<std::size_t>((ticket - 1) % effective_.size());
}
