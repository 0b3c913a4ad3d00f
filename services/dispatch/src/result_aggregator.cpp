#include "../include/result_aggregator.hpp"
#include <utility>

std::string RunSummary::status_line() const {
    if (ok()) return "review completed successfully for " + std::to_string(total) + " files";
    return "review completed with " + std::to_string(failed) + " of " + std::to_string(total) + " files failed";
}

std::string format_review_block(const ReviewUnit& unit, const std::string& review) {
    std::string block;
    block.reserve(review.size() + unit.path.size() + 64);
    block += "\n=== Review for " + unit.path + " ===\n";
    block += "File size: " + std::to_string(unit.size) + " bytes\n";
    block += "Review:\n" + review + "\n\n";
    return block;
}

ResultAggregator::ResultAggregator(ReportSink& sink) : sink_(sink) {}

void ResultAggregator::record(const ReviewUnit& unit, const ReviewOutcome& outcome) {
    std::string block;
    std::string failure;
    if (const auto* ok = std::get_if<ReviewSuccess>(&outcome)) {
        block = format_review_block(unit, ok->text);
    } else {
        failure = "failed to review " + unit.path + ": " + describe(std::get<ReviewFailure>(outcome));
    }

    std::lock_guard<std::mutex> lock(mtx_);
    if (failure.empty()) {
        sink_.write_block(block);
        ++summary_.succeeded;
    } else {
        summary_.failures.push_back(std::move(failure));
        ++summary_.failed;
    }
    ++summary_.total;
}

RunSummary ResultAggregator::summary() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return summary_;
}
