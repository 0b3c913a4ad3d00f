#include "../include/failover_dispatcher.hpp"
#include "../../../shared/cpp/chat_sdk/include/cancel_token.hpp"
#include <utility>

FailoverDispatcher::FailoverDispatcher(EndpointPool& pool, ReviewClient& client)
    : pool_(pool), client_(client) {}

ReviewOutcome FailoverDispatcher::review(const ReviewUnit& unit, const CancelToken& cancel) {
    const auto& endpoints = pool_.effective_endpoints();
    if (endpoints.empty()) {
        return ReviewFailure{FailureKind::NoEndpoints, "no endpoints configured", {}};
    }

    const std::size_t n = endpoints.size();
    const std::size_t start = pool_.next_start_index();
    std::vector<EndpointFailure> failures;
    failures.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        if (cancel.cancelled()) {
            return ReviewFailure{FailureKind::Cancelled, "review cancelled", std::move(failures)};
        }
        const std::string& ep = endpoints[(start + i) % n];
        ChatResult r = client_.attempt(ep, unit, cancel);
        if (auto* reply = std::get_if<ChatReply>(&r)) {
            return ReviewSuccess{std::move(reply->content), ep, i + 1};
        }
        ChatError& err = std::get<ChatError>(r);
        if (err.cancelled) {
            failures.push_back({ep, std::move(err)});
            return ReviewFailure{FailureKind::Cancelled, "review cancelled", std::move(failures)};
        }
        failures.push_back({ep, std::move(err)});
    }

    return ReviewFailure{FailureKind::Exhausted,
                         "all " + std::to_string(n) + " endpoints failed",
                         std::move(failures)};
}
