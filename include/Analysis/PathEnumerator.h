/// @file PathEnumerator.h
/// @brief Lazy enumeration of entry-point-to-sink paths.
///
/// Paths are produced depth-first, entry points and out-edges both in
/// declaration order, so two runs over the same graph yield the same
/// sequence. A node occurs at most once per path; a back-edge that would
/// revisit a node is cut and the cut is recorded on the paths emitted while
/// the cutting node is still on the stack.
///
/// Crossing a Never edge (or leaving a DeadGuard node) turns the rest of that
/// branch into dead code: the first completion to the sink is emitted as a
/// single dead path and the branch is abandoned.
///
/// When no EntryPoint reaches the sink, enumeration starts instead from the
/// unwired roots: reaching nodes without any predecessor. Each root is dead
/// code and yields exactly one path.

#ifndef TAINTREACH_ANALYSIS_PATHENUMERATOR_H
#define TAINTREACH_ANALYSIS_PATHENUMERATOR_H

#include <llvm/ADT/BitVector.h>

#include <cstddef>
#include <vector>

#include "Classifier/NodeClassifier.h"
#include "Graph/TaintGraph.h"

namespace taintreach {

/// @brief One path from an entry point to a sink.
struct TaintPath {
    /// Node indices, entry point first, sink last.
    std::vector<unsigned> Nodes;
    /// Condition of each traversed edge; Conditions[i] guards
    /// Nodes[i] -> Nodes[i + 1].
    std::vector<BranchCondition> Conditions;
    /// A back-edge was cut while this path's prefix was explored.
    bool Truncated = false;

    unsigned getEntry() const { return Nodes.front(); }
    unsigned getSink() const { return Nodes.back(); }
};

/// @brief Restartable, lazy generator of the paths reaching one sink.
class PathEnumerator {
public:
    /// @param MaxPaths Stop after this many paths; 0 means unbounded.
    PathEnumerator(const ClassifiedGraph &CG, unsigned Sink,
                   size_t MaxPaths = 0);

    /// @brief Produces the next path into @p Out.
    /// @return false once the sequence (or the path limit) is exhausted.
    bool next(TaintPath &Out);

    /// @brief Rewinds to the first path.
    void reset();

    /// @brief Drains the remaining sequence.
    std::vector<TaintPath> collect();

    /// @brief Whether enumeration stopped early because of MaxPaths.
    bool hitPathLimit() const { return LimitHit; }

    /// @brief Number of back-edges cut so far.
    unsigned getNumTruncations() const { return NumTruncations; }

    /// @brief Whether any EntryPoint can reach the sink in the raw graph.
    bool hasReachingEntry() const { return !Unwired; }

    /// @brief Whether any other node can reach the sink in the raw graph.
    bool hasPredecessor() const;

    unsigned getSink() const { return Sink; }

private:
    struct Frame {
        unsigned Node;
        unsigned NextEdge;
        bool CutBackEdge;
    };

    void push(unsigned Node);
    void pop();
    void emit(TaintPath &Out) const;
    void unwindDeadBranch();

    const ClassifiedGraph &CG;
    const TaintGraph &G;
    unsigned Sink;
    size_t MaxPaths;

    /// Nodes that can reach the sink; nothing else is ever expanded.
    llvm::BitVector Reaching;
    std::vector<unsigned> Entries;
    /// Entries are unwired roots rather than EntryPoints.
    bool Unwired = false;

    // DFS state.
    std::vector<Frame> Stack;
    std::vector<BranchCondition> StackConditions;
    llvm::BitVector OnPath;
    size_t NextEntry = 0;
    bool InDeadBranch = false;
    size_t DeadBranchDepth = 0;

    size_t NumEmitted = 0;
    unsigned NumTruncations = 0;
    bool LimitHit = false;
};

/// @brief Entry point of the enumeration API; the result is lazy.
inline PathEnumerator enumeratePaths(const ClassifiedGraph &CG, unsigned Sink,
                                     size_t MaxPaths = 0) {
    return PathEnumerator(CG, Sink, MaxPaths);
}

} // namespace taintreach

#endif // TAINTREACH_ANALYSIS_PATHENUMERATOR_H
