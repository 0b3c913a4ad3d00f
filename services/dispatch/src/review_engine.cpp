#include "../include/review_engine.hpp"
#include "../include/bounded_scheduler.hpp"
#include "../include/content_validator.hpp"
#include "../../../shared/cpp/chat_sdk/include/cancel_token.hpp"
#include <iostream>

namespace {
void log_line(const std::string& msg) {
    std::cerr << ("[aireview] " + msg + "\n");
}
}

ReviewEngine::ReviewEngine(const EngineConfig& cfg, ReviewClient& client, ReportSink& sink)
    : cfg_(cfg), pool_(cfg.endpoints, cfg.fallback_url), dispatcher_(pool_, client), sink_(sink) {}

ReviewOutcome ReviewEngine::review_one(const ReviewUnit& unit, const CancelToken& cancel) {
    if (unit.content.size() > cfg_.max_unit_size) {
        return ReviewFailure{FailureKind::Validation,
                             "file size exceeds maximum allowed size of " + std::to_string(cfg_.max_unit_size) + " bytes",
                             {}};
    }
    if (auto invalid = validate_content(unit.content)) {
        return ReviewFailure{FailureKind::Validation, *invalid, {}};
    }
    if (cancel.cancelled()) {
        return ReviewFailure{FailureKind::Cancelled, "review cancelled", {}};
    }

    log_line("Reviewing: " + unit.path);
    ReviewOutcome outcome = dispatcher_.review(unit, cancel);
    if (const auto* ok = std::get_if<ReviewSuccess>(&outcome)) {
        if (ok->attempts > 1) {
            log_line("Reviewed " + unit.path + " via " + ok->endpoint + " after " +
                     std::to_string(ok->attempts) + " attempts");
        }
    }
    return outcome;
}

RunSummary ReviewEngine::run(const std::vector<ReviewUnit>& units, const CancelToken& cancel) {
    ResultAggregator aggregator(sink_);
    if (units.empty()) return aggregator.summary();

    BoundedScheduler scheduler(cfg_.max_concurrency);
    scheduler.run_all(
        units,
        [&](const ReviewUnit& u) { return review_one(u, cancel); },
        [&](const ReviewUnit& u, const ReviewOutcome& o) { aggregator.record(u, o); });
    return aggregator.summary();
}
