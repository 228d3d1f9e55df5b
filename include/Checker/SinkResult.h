/// @file SinkResult.h
/// @brief Outcome of analyzing one sink: its paths, their verdicts and the
/// aggregated sink verdict, or the error that stopped the analysis.

#ifndef TAINTREACH_CHECKER_SINKRESULT_H
#define TAINTREACH_CHECKER_SINKRESULT_H

#include <string>
#include <vector>

#include "Analysis/PathEnumerator.h"
#include "Analysis/PathVerdict.h"
#include "Analysis/SinkAggregator.h"

namespace taintreach {

struct SinkResult {
    /// Node index of the sink.
    unsigned Sink = 0;

    std::vector<TaintPath> Paths;
    /// Verdicts[i] belongs to Paths[i].
    std::vector<PathVerdict> Verdicts;
    SinkVerdict Verdict;

    std::vector<std::string> Warnings;

    /// Non-empty iff the analysis of this sink failed; Verdict.Overall is
    /// then SinkVerdictKind::Error.
    std::string Error;

    bool hasError() const { return !Error.empty(); }
};

} // namespace taintreach

#endif // TAINTREACH_CHECKER_SINKRESULT_H
