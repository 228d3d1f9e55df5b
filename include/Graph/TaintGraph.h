/// @file TaintGraph.h
/// @brief Call graph annotated for taint-path classification.
///
/// Nodes are owned by the graph and never change after insertion. Edges keep
/// the order in which they were declared, which the path enumerator relies
/// on for reproducible results.

#ifndef TAINTREACH_GRAPH_TAINTGRAPH_H
#define TAINTREACH_GRAPH_TAINTGRAPH_H

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/BitVector.h>
#include <llvm/ADT/Optional.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "Graph/GraphError.h"

namespace taintreach {

/// @brief Structural kind of a node, as declared by the front end.
enum class NodeKind {
    EntryPoint, ///< Externally callable function (route handler, main, ...)
    Call,       ///< Ordinary function or service call
    Branch,     ///< Conditional split inside a function
    Sink,       ///< Dangerous operation (query execution, template render)
};

/// @brief Static reachability of an edge, decided by the front end.
enum class BranchCondition {
    Always,  ///< Unconditional traversal
    Never,   ///< Statically false guard; the target is dead through this edge
    Runtime, ///< Depends on runtime values; treated as reachable
};

llvm::StringRef toString(NodeKind Kind);
llvm::StringRef toString(BranchCondition Cond);

/// @brief Case-insensitive parse of a NodeKind name ("entrypoint", "sink", ...).
llvm::Optional<NodeKind> parseNodeKind(llvm::StringRef Name);

/// @brief Case-insensitive parse of a BranchCondition name.
llvm::Optional<BranchCondition> parseBranchCondition(llvm::StringRef Name);

/// Declared metadata of a node, e.g. {"role": "validator", "strength": "strict"}.
using TagMap = std::map<std::string, std::string>;

class TaintGraph;

/// @brief A node of the taint graph.
class TaintNode {
public:
    TaintNode(std::string Id, NodeKind Kind, TagMap Tags = TagMap())
        : Id(std::move(Id)), Kind(Kind), Tags(std::move(Tags)) {}

    const std::string &getId() const { return Id; }
    NodeKind getKind() const { return Kind; }
    const TagMap &getTags() const { return Tags; }

    /// @brief Returns the value of tag @p Key, if declared.
    llvm::Optional<llvm::StringRef> getTag(llvm::StringRef Key) const;

    /// @brief Position of this node in declaration order.
    unsigned getIndex() const { return Index; }

    bool isEntryPoint() const { return Kind == NodeKind::EntryPoint; }
    bool isSink() const { return Kind == NodeKind::Sink; }

private:
    friend class TaintGraph;

    std::string Id;
    NodeKind Kind;
    TagMap Tags;
    unsigned Index = 0;
};

/// @brief A directed edge between two nodes, identified by node index.
struct TaintEdge {
    unsigned From;
    unsigned To;
    BranchCondition Condition;
};

/// @brief The program graph: nodes, edges and registered entry points.
///
/// Construction throws StructuralGraphError subclasses on malformed input.
/// Once built, the graph is only read, so concurrent queries are safe.
class TaintGraph {
public:
    TaintGraph() = default;
    TaintGraph(const TaintGraph &) = delete;
    TaintGraph &operator=(const TaintGraph &) = delete;
    TaintGraph(TaintGraph &&) = default;
    TaintGraph &operator=(TaintGraph &&) = default;

    /// @brief Adds a node. Throws DuplicateNodeError on id collision.
    /// @return The stored node.
    const TaintNode &addNode(TaintNode Node);

    /// @brief Convenience overload building the node in place.
    const TaintNode &addNode(std::string Id, NodeKind Kind,
                             TagMap Tags = TagMap());

    /// @brief Adds a directed edge. Throws DanglingEdgeError if either end
    /// is unknown. Self-loops and back-edges are allowed.
    void addEdge(llvm::StringRef From, llvm::StringRef To,
                 BranchCondition Condition = BranchCondition::Always);

    /// @brief Marks an entry point as reachable from the outside.
    ///
    /// Throws UnknownNodeError for an undeclared id and StructuralGraphError
    /// if the node is not an EntryPoint.
    void markEntryRegistered(llvm::StringRef Id);

    /// @brief Looks a node up by id; nullptr if absent.
    const TaintNode *findNode(llvm::StringRef Id) const;

    /// @brief Looks a node up by id; throws UnknownNodeError if absent.
    const TaintNode &getNode(llvm::StringRef Id) const;

    const TaintNode &getNode(unsigned Index) const { return *Nodes[Index]; }
    const TaintEdge &getEdge(unsigned Index) const { return Edges[Index]; }

    unsigned getNumNodes() const { return static_cast<unsigned>(Nodes.size()); }
    unsigned getNumEdges() const { return static_cast<unsigned>(Edges.size()); }

    /// @brief Indices of the edges leaving @p Node, in declaration order.
    llvm::ArrayRef<unsigned> getOutEdges(unsigned Node) const {
        return OutEdges[Node];
    }

    /// @brief Indices of the edges entering @p Node, in declaration order.
    llvm::ArrayRef<unsigned> getInEdges(unsigned Node) const {
        return InEdges[Node];
    }

    /// @brief EntryPoint nodes (registered or not) in declaration order.
    std::vector<unsigned> getEntryPoints() const;

    /// @brief Sink nodes in declaration order.
    std::vector<unsigned> getSinks() const;

    bool isRegistered(unsigned Node) const { return Registered[Node]; }

    /// @brief Every node from which @p Target is reachable (Target included),
    /// ignoring branch conditions.
    llvm::BitVector computeReachingSet(unsigned Target) const;

    void dump(llvm::raw_ostream &OS) const;

private:
    std::vector<std::unique_ptr<TaintNode>> Nodes;
    std::vector<TaintEdge> Edges;
    std::vector<llvm::SmallVector<unsigned, 4>> OutEdges;
    std::vector<llvm::SmallVector<unsigned, 4>> InEdges;
    llvm::StringMap<unsigned> IdToIndex;
    llvm::BitVector Registered;
};

} // namespace taintreach

#endif // TAINTREACH_GRAPH_TAINTGRAPH_H
