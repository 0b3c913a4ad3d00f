#include "../include/bounded_scheduler.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>

BoundedScheduler::BoundedScheduler(std::size_t concurrency) : gate_(concurrency) {}

ReviewOutcome BoundedScheduler::run_guarded(const ReviewUnit& unit, const UnitTask& task) {
    GateSlot slot(gate_);
    try {
        return task(unit);
    } catch (const std::exception& e) {
        return ReviewFailure{FailureKind::Internal, std::string("unexpected error: ") + e.what(), {}};
    } catch (...) {
        return ReviewFailure{FailureKind::Internal, "unexpected error: unknown exception", {}};
    }
}

std::vector<UnitResult> BoundedScheduler::run_all(const std::vector<ReviewUnit>& units,
                                                  const UnitTask& task,
                                                  const CompletionFn& on_complete) {
    std::vector<UnitResult> results;
    results.reserve(units.size());
    std::mutex results_mtx;
    std::exception_ptr sink_error;
    std::atomic<std::size_t> next{0};

    auto worker = [&] {
        for (std::size_t i = next.fetch_add(1); i < units.size(); i = next.fetch_add(1)) {
            ReviewOutcome outcome = run_guarded(units[i], task);
            if (on_complete) {
                try {
                    on_complete(units[i], outcome);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(results_mtx);
                    if (!sink_error) sink_error = std::current_exception();
                }
            }
            std::lock_guard<std::mutex> lock(results_mtx);
            results.push_back(UnitResult{i, std::move(outcome)});
        }
    };

    const std::size_t wanted = std::min(gate_.capacity(), units.size());
    std::vector<std::thread> threads;
    threads.reserve(wanted);
    for (std::size_t w = 0; w < wanted; ++w) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& e) {
            // Workers already running drain the remaining units.
            std::cerr << ("[aireview] Warning: started " + std::to_string(threads.size()) + " of " +
                          std::to_string(wanted) + " workers: " + e.what() + "\n");
            break;
        }
    }
    if (threads.empty()) worker();
    for (auto& t : threads) t.join();

    if (sink_error) std::rethrow_exception(sink_error);
    return results;
}
