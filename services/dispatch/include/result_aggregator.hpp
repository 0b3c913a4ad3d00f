#pragma once
#include "outcome.hpp"
#include "report_sink.hpp"
#include "review_unit.hpp"
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

struct RunSummary {
    std::size_t total{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::vector<std::string> failures; // "failed to review <path>: <reason>", in record order

    bool ok() const { return failed == 0; }
    // "review completed successfully for M files" or "review completed with N of M files failed"
    std::string status_line() const;
};

std::string format_review_block(const ReviewUnit& unit, const std::string& review);

// Thread-safe collector: successes go to the sink as whole blocks, failures
// are kept for the closing summary.
class ResultAggregator {
public:
    explicit ResultAggregator(ReportSink& sink);

    void record(const ReviewUnit& unit, const ReviewOutcome& outcome);
    RunSummary summary() const;

private:
    ReportSink& sink_;
    mutable std::mutex mtx_;
    RunSummary summary_;
};
