#pragma once
#include "admission_gate.hpp"
#include "outcome.hpp"
#include "review_unit.hpp"
#include <cstddef>
#include <functional>
#include <vector>

struct UnitResult {
    std::size_t index{0}; // position in the input sequence
    ReviewOutcome outcome;
};

using UnitTask = std::function<ReviewOutcome(const ReviewUnit&)>;
using CompletionFn = std::function<void(const ReviewUnit&, const ReviewOutcome&)>;

// Runs `task` once per unit on at most `concurrency` worker threads, each
// claiming the next unclaimed unit; the gate caps how many are inside `task`.
// Results come back in completion order, exactly one per unit, even when
// fewer workers than requested could be started.
class BoundedScheduler {
public:
    explicit BoundedScheduler(std::size_t concurrency);

    // on_complete runs on the finishing task's thread, outside the gate.
    // If it throws, the first exception is rethrown after every task joined.
    std::vector<UnitResult> run_all(const std::vector<ReviewUnit>& units, const UnitTask& task,
                                    const CompletionFn& on_complete = {});

    const AdmissionGate& gate() const { return gate_; }

private:
    ReviewOutcome run_guarded(const ReviewUnit& unit, const UnitTask& task);

    AdmissionGate gate_;
};
