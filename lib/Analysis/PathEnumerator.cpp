#include <llvm/ADT/Statistic.h>

#include "Analysis/PathEnumerator.h"
#include "Support/Debug.h"

#define DEBUG_TYPE "path-enum"

using namespace llvm;

STATISTIC(NumPathsEnumerated, "Number of entry-to-sink paths enumerated");
STATISTIC(NumBackEdgesCut, "Number of back-edges cut by the revisit cap");
STATISTIC(NumDeadBranches, "Number of dead branches collapsed to one path");

namespace taintreach {

PathEnumerator::PathEnumerator(const ClassifiedGraph &CG, unsigned Sink,
                               size_t MaxPaths)
    : CG(CG), G(CG.getGraph()), Sink(Sink), MaxPaths(MaxPaths),
      Reaching(G.computeReachingSet(Sink)), OnPath(G.getNumNodes()) {
    for (unsigned Entry : G.getEntryPoints())
        if (Reaching.test(Entry))
            Entries.push_back(Entry);
    if (!Entries.empty())
        return;

    // Only unwired code reaches the sink; start from its roots.
    Unwired = true;
    for (unsigned Node : Reaching.set_bits()) {
        if (Node == Sink)
            continue;
        bool IsRoot = true;
        for (unsigned EdgeIdx : G.getInEdges(Node))
            if (G.getEdge(EdgeIdx).From != Node)
                IsRoot = false;
        if (IsRoot)
            Entries.push_back(Node);
    }
}

bool PathEnumerator::hasPredecessor() const { return Reaching.count() > 1; }

void PathEnumerator::reset() {
    Stack.clear();
    StackConditions.clear();
    OnPath.reset();
    NextEntry = 0;
    InDeadBranch = false;
    DeadBranchDepth = 0;
    NumEmitted = 0;
    NumTruncations = 0;
    LimitHit = false;
}

void PathEnumerator::push(unsigned Node) {
    Stack.push_back(Frame{Node, 0, false});
    OnPath.set(Node);
}

void PathEnumerator::pop() {
    if (Stack.size() > 1)
        StackConditions.pop_back();
    OnPath.reset(Stack.back().Node);
    Stack.pop_back();
}

void PathEnumerator::emit(TaintPath &Out) const {
    Out.Nodes.clear();
    Out.Truncated = false;
    for (const Frame &F : Stack) {
        Out.Nodes.push_back(F.Node);
        Out.Truncated |= F.CutBackEdge;
    }
    Out.Conditions = StackConditions;
}

void PathEnumerator::unwindDeadBranch() {
    while (Stack.size() > DeadBranchDepth)
        pop();
    InDeadBranch = false;
}

bool PathEnumerator::next(TaintPath &Out) {
    if (LimitHit)
        return false;

    while (true) {
        if (Stack.empty()) {
            if (NextEntry >= Entries.size())
                return false;
            push(Entries[NextEntry++]);
            if (Unwired) {
                InDeadBranch = true;
                DeadBranchDepth = 0;
            }
            continue;
        }

        Frame &Top = Stack.back();
        ArrayRef<unsigned> OutEdges = G.getOutEdges(Top.Node);
        if (Top.NextEdge == OutEdges.size()) {
            pop();
            // The dead branch was exhausted without reaching the sink.
            if (InDeadBranch && Stack.size() <= DeadBranchDepth)
                InDeadBranch = false;
            continue;
        }

        const TaintEdge &Edge = G.getEdge(OutEdges[Top.NextEdge++]);
        if (!Reaching.test(Edge.To))
            continue;

        if (OnPath.test(Edge.To)) {
            Top.CutBackEdge = true;
            ++NumTruncations;
            ++NumBackEdgesCut;
            TAINTREACH_DEBUG("cut back-edge " << G.getNode(Top.Node).getId()
                                              << " -> "
                                              << G.getNode(Edge.To).getId());
            continue;
        }

        bool Dead = Edge.Condition == BranchCondition::Never ||
                    CG.getRole(Top.Node) == NodeRole::DeadGuard;

        // Top is invalidated by the push below.
        StackConditions.push_back(Edge.Condition);
        push(Edge.To);

        if (Dead && !InDeadBranch) {
            InDeadBranch = true;
            DeadBranchDepth = Stack.size() - 1;
        }

        if (Edge.To != Sink)
            continue;

        if (MaxPaths != 0 && NumEmitted == MaxPaths) {
            LimitHit = true;
            TAINTREACH_DEBUG("path limit " << MaxPaths << " reached for "
                                           << G.getNode(Sink).getId());
            return false;
        }

        emit(Out);
        ++NumEmitted;
        ++NumPathsEnumerated;
        pop();
        if (InDeadBranch) {
            ++NumDeadBranches;
            unwindDeadBranch();
        }
        return true;
    }
}

std::vector<TaintPath> PathEnumerator::collect() {
    std::vector<TaintPath> Paths;
    TaintPath P;
    while (next(P))
        Paths.push_back(P);
    return Paths;
}

} // namespace taintreach
