#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/raw_ostream.h>

#include "Analysis/SinkAggregator.h"
#include "Support/Debug.h"

#define DEBUG_TYPE "aggregate"

using namespace llvm;

namespace taintreach {

StringRef toString(SinkVerdictKind Kind) {
    switch (Kind) {
    case SinkVerdictKind::MustFix: return "MUST_FIX";
    case SinkVerdictKind::GoodToFix: return "GOOD_TO_FIX";
    case SinkVerdictKind::FalsePositive: return "FALSE_POSITIVE";
    case SinkVerdictKind::DeadCode: return "DEAD_CODE";
    case SinkVerdictKind::Error: return "ERROR";
    }
    llvm_unreachable("unknown SinkVerdictKind");
}

namespace {

// Lower is worse.
unsigned rank(SinkVerdictKind Kind) {
    switch (Kind) {
    case SinkVerdictKind::MustFix: return 0;
    case SinkVerdictKind::GoodToFix: return 1;
    case SinkVerdictKind::FalsePositive: return 2;
    case SinkVerdictKind::DeadCode: return 3;
    case SinkVerdictKind::Error: return 4;
    }
    llvm_unreachable("unknown SinkVerdictKind");
}

StringRef describe(PathVerdictKind Kind) {
    switch (Kind) {
    case PathVerdictKind::Vulnerable: return "vulnerable";
    case PathVerdictKind::PartiallyMitigated: return "partially mitigated";
    case PathVerdictKind::Sanitized: return "sanitized";
    case PathVerdictKind::AuthProtected: return "auth-protected";
    case PathVerdictKind::Dead: return "dead";
    }
    llvm_unreachable("unknown PathVerdictKind");
}

} // namespace

SinkVerdictKind SinkAggregator::severityOf(PathVerdictKind Kind) const {
    switch (Kind) {
    case PathVerdictKind::Vulnerable: return SinkVerdictKind::MustFix;
    case PathVerdictKind::PartiallyMitigated: return Policy.WeakValidatorVerdict;
    case PathVerdictKind::Sanitized: return SinkVerdictKind::FalsePositive;
    case PathVerdictKind::AuthProtected: return Policy.AuthProtectedVerdict;
    case PathVerdictKind::Dead: return SinkVerdictKind::DeadCode;
    }
    llvm_unreachable("unknown PathVerdictKind");
}

SinkVerdict SinkAggregator::aggregate(const TaintNode &Sink,
                                      ArrayRef<PathVerdict> Verdicts) const {
    SinkVerdict Result;
    bool AnyTruncated = false;
    bool AnyUnclassifiable = false;

    for (const PathVerdict &V : Verdicts) {
        AnyTruncated |= V.Truncated;
        if (!V.isLive()) {
            ++Result.NumDead;
            continue;
        }
        ++Result.NumLive;
        Result.Reasons.insert(V.Kind);
        AnyUnclassifiable |= V.HasUnclassifiable;

        SinkVerdictKind Severity = severityOf(V.Kind);
        if (rank(Severity) < rank(Result.Overall))
            Result.Overall = Severity;
    }

    // Deciding paths: the live paths that force the overall verdict.
    bool DecidedAtRuntimeOnly = Result.NumLive != 0;
    for (const PathVerdict &V : Verdicts)
        if (V.isLive() && severityOf(V.Kind) == Result.Overall &&
            !V.ReliesOnRuntime)
            DecidedAtRuntimeOnly = false;

    int Confidence = 100;
    if (AnyTruncated)
        Confidence -= 20;
    if (AnyUnclassifiable)
        Confidence -= 20;
    if (DecidedAtRuntimeOnly)
        Confidence -= 10;
    Result.Confidence = Confidence < 0 ? 0 : static_cast<unsigned>(Confidence);

    raw_string_ostream OS(Result.Rationale);
    OS << Verdicts.size() << (Verdicts.size() == 1 ? " path" : " paths")
       << " (" << Result.NumLive << " live, " << Result.NumDead << " dead); ";
    if (Result.Reasons.empty()) {
        OS << "no live path";
    } else {
        OS << "live: ";
        bool First = true;
        for (PathVerdictKind K : Result.Reasons) {
            if (!First)
                OS << ", ";
            OS << describe(K);
            First = false;
        }
    }
    OS.flush();

    TAINTREACH_DEBUG(Sink.getId() << ": " << toString(Result.Overall) << " ["
                                  << Result.Rationale << "]");
    return Result;
}

} // namespace taintreach
