#pragma once
#include "../../../shared/cpp/chat_sdk/include/chat_client.hpp"
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

enum class FailureKind {
    Validation,  // unit never sent
    NoEndpoints,
    Exhausted,   // every endpoint failed; see attempts
    Cancelled,
    Internal     // unexpected fault inside the unit task
};

const char* to_string(FailureKind kind);

struct EndpointFailure {
    std::string endpoint;
    ChatError error;
};

struct ReviewSuccess {
    std::string text;
    std::string endpoint;
    std::size_t attempts{0};
};

struct ReviewFailure {
    FailureKind kind{FailureKind::Internal};
    std::string reason;
    std::vector<EndpointFailure> attempts; // in the order tried
};

using ReviewOutcome = std::variant<ReviewSuccess, ReviewFailure>;

inline bool succeeded(const ReviewOutcome& o) { return std::holds_alternative<ReviewSuccess>(o); }

// "<reason>: <ep>: <msg>; <ep>: <msg>"
std::string describe(const ReviewFailure& f);
