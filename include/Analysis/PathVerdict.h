/// @file PathVerdict.h
/// @brief Folds one path into a single verdict with supporting evidence.

#ifndef TAINTREACH_ANALYSIS_PATHVERDICT_H
#define TAINTREACH_ANALYSIS_PATHVERDICT_H

#include <llvm/ADT/Optional.h>
#include <llvm/ADT/StringRef.h>

#include "Analysis/PathEnumerator.h"
#include "Classifier/NodeClassifier.h"

namespace taintreach {

enum class PathVerdictKind {
    Vulnerable,
    PartiallyMitigated,
    Sanitized,
    AuthProtected,
    Dead,
};

/// Why a path is not live.
enum class DeadReason {
    None,
    UnregisteredEntry,
    /// The path starts at a function no entry point calls.
    Unwired,
    NeverEdge,
    DeadGuard,
};

llvm::StringRef toString(PathVerdictKind Kind);
llvm::StringRef toString(DeadReason Reason);

/// True for the kinds that still count as exploitable.
inline bool isExploitable(PathVerdictKind Kind) {
    return Kind == PathVerdictKind::Vulnerable ||
           Kind == PathVerdictKind::PartiallyMitigated;
}

struct PathVerdict {
    PathVerdictKind Kind = PathVerdictKind::Vulnerable;
    DeadReason Dead = DeadReason::None;

    bool AuthGateSeen = false;
    bool RateLimiterSeen = false;
    bool WeakValidatorSeen = false;

    /// First node that neutralized the taint, if any.
    llvm::Optional<unsigned> Protector;
    /// First authorization gate on the path, if any.
    llvm::Optional<unsigned> Gate;

    /// A back-edge was cut while the path was enumerated.
    bool Truncated = false;
    /// Some edge of the path is only reachable at runtime.
    bool ReliesOnRuntime = false;
    /// Some node of the path carried a rejected tag.
    bool HasUnclassifiable = false;

    bool isLive() const { return Kind != PathVerdictKind::Dead; }
};

/// @brief Applies the ordered protection rules to a path:
/// dead code, then sanitization, then authorization, then weak validation.
class PathVerdictEngine {
public:
    explicit PathVerdictEngine(const ClassifiedGraph &CG) : CG(CG) {}

    PathVerdict classify(const TaintPath &Path) const;

    /// @brief Liveness check alone; DeadReason::None means live.
    DeadReason computeDeadReason(const TaintPath &Path) const;

private:
    const ClassifiedGraph &CG;
};

} // namespace taintreach

#endif // TAINTREACH_ANALYSIS_PATHVERDICT_H
