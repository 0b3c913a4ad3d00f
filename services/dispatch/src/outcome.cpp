#include "../include/outcome.hpp"

const char* to_string(FailureKind kind) {
    switch (kind) {
    case FailureKind::Validation: return "validation";
    case FailureKind::NoEndpoints: return "no endpoints";
    case FailureKind::Exhausted: return "exhausted";
    case FailureKind::Cancelled: return "cancelled";
    case FailureKind::Internal: return "internal";
    }
    return "unknown";
}

std::string describe(const ReviewFailure& f) {
    std::string out = f.reason;
    if (f.attempts.empty()) return out;
    out += ": ";
    for (std::size_t i = 0; i < f.attempts.size(); ++i) {
        if (i) out += "; ";
        out += f.attempts[i].endpoint + ": " + f.attempts[i].error.message;
    }
    return out;
}
