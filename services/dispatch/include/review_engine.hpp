#pragma once
#include "endpoint_pool.hpp"
#include "failover_dispatcher.hpp"
#include "report_sink.hpp"
#include "result_aggregator.hpp"
#include "review_client.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class CancelToken;

struct EngineConfig {
    std::vector<std::string> endpoints;
    std::string fallback_url;
    std::size_t max_concurrency{3};
    std::uintmax_t max_unit_size{1024 * 1024};
};

// One review run: validate, dispatch with failover, aggregate.
class ReviewEngine {
public:
    ReviewEngine(const EngineConfig& cfg, ReviewClient& client, ReportSink& sink);

    RunSummary run(const std::vector<ReviewUnit>& units, const CancelToken& cancel);

    // The per-unit task body; also usable on its own.
    ReviewOutcome review_one(const ReviewUnit& unit, const CancelToken& cancel);

    const EndpointPool& pool() const { return pool_; }

private:
    EngineConfig cfg_;
    EndpointPool pool_;
    FailoverDispatcher dispatcher_;
    ReportSink& sink_;
};
