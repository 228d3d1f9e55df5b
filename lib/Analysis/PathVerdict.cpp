#include <llvm/Support/ErrorHandling.h>

#include "Analysis/PathVerdict.h"

using namespace llvm;

namespace taintreach {

StringRef toString(PathVerdictKind Kind) {
    switch (Kind) {
    case PathVerdictKind::Vulnerable: return "VULNERABLE";
    case PathVerdictKind::PartiallyMitigated: return "PARTIALLY_MITIGATED";
    case PathVerdictKind::Sanitized: return "SANITIZED";
    case PathVerdictKind::AuthProtected: return "AUTH_PROTECTED";
    case PathVerdictKind::Dead: return "DEAD";
    }
    llvm_unreachable("unknown PathVerdictKind");
}

StringRef toString(DeadReason Reason) {
    switch (Reason) {
    case DeadReason::None: return "none";
    case DeadReason::UnregisteredEntry: return "unregistered-entry";
    case DeadReason::Unwired: return "unwired";
    case DeadReason::NeverEdge: return "never-edge";
    case DeadReason::DeadGuard: return "dead-guard";
    }
    llvm_unreachable("unknown DeadReason");
}

DeadReason PathVerdictEngine::computeDeadReason(const TaintPath &Path) const {
    const TaintGraph &G = CG.getGraph();
    if (!G.getNode(Path.getEntry()).isEntryPoint())
        return DeadReason::Unwired;
    if (!G.isRegistered(Path.getEntry()))
        return DeadReason::UnregisteredEntry;

    for (size_t I = 0; I < Path.Conditions.size(); ++I) {
        if (Path.Conditions[I] == BranchCondition::Never)
            return DeadReason::NeverEdge;
        if (CG.getRole(Path.Nodes[I]) == NodeRole::DeadGuard)
            return DeadReason::DeadGuard;
    }
    return DeadReason::None;
}

PathVerdict PathVerdictEngine::classify(const TaintPath &Path) const {
    PathVerdict V;
    V.Truncated = Path.Truncated;
    for (BranchCondition C : Path.Conditions)
        if (C == BranchCondition::Runtime)
            V.ReliesOnRuntime = true;

    const NodeClassification &SinkClass = CG.getClassification(Path.getSink());

    // Everything strictly before the sink.
    for (size_t I = 0; I + 1 < Path.Nodes.size(); ++I) {
        unsigned Node = Path.Nodes[I];
        const NodeClassification &C = CG.getClassification(Node);
        if (C.Unclassifiable)
            V.HasUnclassifiable = true;

        switch (C.Role) {
        case NodeRole::AuthzGate:
            V.AuthGateSeen = true;
            if (!V.Gate)
                V.Gate = Node;
            break;
        case NodeRole::RateLimiter:
            V.RateLimiterSeen = true;
            break;
        case NodeRole::Validator:
            if (C.Strength == ValidatorStrength::Weak)
                V.WeakValidatorSeen = true;
            break;
        default:
            break;
        }

        if (!V.Protector && C.neutralizes(SinkClass.Subtype))
            V.Protector = Node;
    }

    V.Dead = computeDeadReason(Path);
    if (V.Dead != DeadReason::None)
        V.Kind = PathVerdictKind::Dead;
    else if (V.Protector)
        V.Kind = PathVerdictKind::Sanitized;
    else if (V.AuthGateSeen)
        V.Kind = PathVerdictKind::AuthProtected;
    else if (V.WeakValidatorSeen)
        V.Kind = PathVerdictKind::PartiallyMitigated;
    else
        V.Kind = PathVerdictKind::Vulnerable;
    return V;
}

} // namespace taintreach
