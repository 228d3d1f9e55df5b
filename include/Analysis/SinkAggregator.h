/// @file SinkAggregator.h
/// @brief Combines the verdicts of every path reaching a sink.
///
/// The worst live path decides: any exploitable live path escalates the sink,
/// benign live paths (sanitized or authorization-gated) never do, and a sink
/// with no live path at all is dead code.

#ifndef TAINTREACH_ANALYSIS_SINKAGGREGATOR_H
#define TAINTREACH_ANALYSIS_SINKAGGREGATOR_H

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>

#include <set>
#include <string>

#include "Analysis/PathVerdict.h"
#include "Graph/TaintGraph.h"

namespace taintreach {

enum class SinkVerdictKind {
    MustFix,
    GoodToFix,
    FalsePositive,
    DeadCode,
    /// The sink could not be analyzed; see the report entry's error.
    Error,
};

llvm::StringRef toString(SinkVerdictKind Kind);

/// @brief Where the exploitable/benign boundary lies. The defaults follow
/// the usual triage practice; both knobs exist because that boundary is a
/// judgment call about real-world exploitability.
struct AggregationPolicy {
    /// Overall verdict for a sink whose worst live path is only weakly
    /// validated. GoodToFix or MustFix.
    SinkVerdictKind WeakValidatorVerdict = SinkVerdictKind::GoodToFix;

    /// Overall verdict for a live path protected only by authorization.
    /// FalsePositive or GoodToFix.
    SinkVerdictKind AuthProtectedVerdict = SinkVerdictKind::FalsePositive;

    /// Per-sink enumeration bound; 0 disables it.
    size_t MaxPathsPerSink = 10000;
};

struct SinkVerdict {
    SinkVerdictKind Overall = SinkVerdictKind::DeadCode;
    /// Distinct verdict kinds among the live paths.
    std::set<PathVerdictKind> Reasons;
    unsigned NumLive = 0;
    unsigned NumDead = 0;
    /// 0-100.
    unsigned Confidence = 100;
    std::string Rationale;
};

class SinkAggregator {
public:
    explicit SinkAggregator(AggregationPolicy Policy = AggregationPolicy())
        : Policy(Policy) {}

    /// @brief Pure and order-independent over @p Verdicts.
    SinkVerdict aggregate(const TaintNode &Sink,
                          llvm::ArrayRef<PathVerdict> Verdicts) const;

    const AggregationPolicy &getPolicy() const { return Policy; }

private:
    /// Overall verdict one live path would force on its own.
    SinkVerdictKind severityOf(PathVerdictKind Kind) const;

    AggregationPolicy Policy;
};

} // namespace taintreach

#endif // TAINTREACH_ANALYSIS_SINKAGGREGATOR_H
