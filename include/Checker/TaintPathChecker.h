/// @file TaintPathChecker.h
/// @brief Runs the per-sink analysis over a whole graph.
///
/// Every sink is an independent unit (enumerate, classify each path,
/// aggregate) scheduled on a bounded worker pool. A unit that fails is
/// recorded as its sink's error and never affects the other sinks.

#ifndef TAINTREACH_CHECKER_TAINTPATHCHECKER_H
#define TAINTREACH_CHECKER_TAINTPATHCHECKER_H

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

#include "Analysis/PathVerdict.h"
#include "Analysis/SinkAggregator.h"
#include "Checker/SinkResult.h"
#include "Classifier/NodeClassifier.h"

namespace taintreach {

/// @brief The run did not finish within CheckerOptions::Timeout.
class AnalysisTimeoutError : public std::runtime_error {
public:
    explicit AnalysisTimeoutError(std::chrono::milliseconds Limit)
        : std::runtime_error("analysis did not finish within " +
                             std::to_string(Limit.count()) + " ms") {}
};

struct CheckerOptions {
    AggregationPolicy Policy;
    /// Worker count; 0 means one per hardware core.
    unsigned NumJobs = 0;
    /// Wall-clock limit for the whole run; 0 disables it.
    std::chrono::milliseconds Timeout{0};
};

class TaintPathChecker {
public:
    TaintPathChecker(const ClassifiedGraph &CG,
                     CheckerOptions Opts = CheckerOptions());

    /// @brief Analyzes every sink. Results are in sink declaration order,
    /// independent of scheduling. Throws AnalysisTimeoutError on expiry.
    std::vector<SinkResult> run();

    /// @brief Analyzes one sink; never throws.
    SinkResult analyzeSink(unsigned Sink) const;

    const CheckerOptions &getOptions() const { return Opts; }

private:
    using Clock = std::chrono::steady_clock;

    SinkResult analyzeSink(unsigned Sink, Clock::time_point Deadline) const;
    void runUnit(unsigned Sink, SinkResult &Result,
                 Clock::time_point Deadline) const;

    const ClassifiedGraph &CG;
    CheckerOptions Opts;
    PathVerdictEngine Engine;
    SinkAggregator Aggregator;

    mutable std::atomic<bool> TimedOut{false};
};

} // namespace taintreach

#endif // TAINTREACH_CHECKER_TAINTPATHCHECKER_H
