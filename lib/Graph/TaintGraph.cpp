/// @file TaintGraph.cpp
/// @brief Construction and raw reachability queries for the taint graph.

#include <llvm/ADT/StringSwitch.h>
#include <llvm/Support/ErrorHandling.h>

#include "Graph/TaintGraph.h"

using namespace llvm;

namespace taintreach {

StringRef toString(NodeKind Kind) {
    switch (Kind) {
    case NodeKind::EntryPoint: return "EntryPoint";
    case NodeKind::Call: return "Call";
    case NodeKind::Branch: return "Branch";
    case NodeKind::Sink: return "Sink";
    }
    llvm_unreachable("unknown NodeKind");
}

StringRef toString(BranchCondition Cond) {
    switch (Cond) {
    case BranchCondition::Always: return "Always";
    case BranchCondition::Never: return "Never";
    case BranchCondition::Runtime: return "Runtime";
    }
    llvm_unreachable("unknown BranchCondition");
}

Optional<NodeKind> parseNodeKind(StringRef Name) {
    std::string Lower = Name.trim().lower();
    return StringSwitch<Optional<NodeKind>>(Lower)
        .Cases("entrypoint", "entry-point", "entry", NodeKind::EntryPoint)
        .Case("call", NodeKind::Call)
        .Case("branch", NodeKind::Branch)
        .Case("sink", NodeKind::Sink)
        .Default(None);
}

Optional<BranchCondition> parseBranchCondition(StringRef Name) {
    std::string Lower = Name.trim().lower();
    return StringSwitch<Optional<BranchCondition>>(Lower)
        .Case("always", BranchCondition::Always)
        .Case("never", BranchCondition::Never)
        .Case("runtime", BranchCondition::Runtime)
        .Default(None);
}

Optional<StringRef> TaintNode::getTag(StringRef Key) const {
    auto It = Tags.find(Key.str());
    if (It == Tags.end())
        return None;
    return StringRef(It->second);
}

const TaintNode &TaintGraph::addNode(TaintNode Node) {
    unsigned Index = getNumNodes();
    auto Inserted = IdToIndex.try_emplace(Node.getId(), Index);
    if (!Inserted.second)
        throw DuplicateNodeError(Node.getId());

    Node.Index = Index;
    Nodes.push_back(std::make_unique<TaintNode>(std::move(Node)));
    OutEdges.emplace_back();
    InEdges.emplace_back();
    Registered.push_back(false);
    return *Nodes.back();
}

const TaintNode &TaintGraph::addNode(std::string Id, NodeKind Kind,
                                     TagMap Tags) {
    return addNode(TaintNode(std::move(Id), Kind, std::move(Tags)));
}

void TaintGraph::addEdge(StringRef From, StringRef To,
                         BranchCondition Condition) {
    auto FromIt = IdToIndex.find(From);
    if (FromIt == IdToIndex.end())
        throw DanglingEdgeError(From.str(), To.str(), From.str());
    auto ToIt = IdToIndex.find(To);
    if (ToIt == IdToIndex.end())
        throw DanglingEdgeError(From.str(), To.str(), To.str());

    unsigned EdgeIdx = getNumEdges();
    Edges.push_back(TaintEdge{FromIt->second, ToIt->second, Condition});
    OutEdges[FromIt->second].push_back(EdgeIdx);
    InEdges[ToIt->second].push_back(EdgeIdx);
}

void TaintGraph::markEntryRegistered(StringRef Id) {
    auto It = IdToIndex.find(Id);
    if (It == IdToIndex.end())
        throw UnknownNodeError(Id.str());
    if (!Nodes[It->second]->isEntryPoint())
        throw StructuralGraphError("node '" + Id.str() +
                                       "' is registered but is not an entry point",
                                   Id.str());
    Registered.set(It->second);
}

const TaintNode *TaintGraph::findNode(StringRef Id) const {
    auto It = IdToIndex.find(Id);
    return It == IdToIndex.end() ? nullptr : Nodes[It->second].get();
}

const TaintNode &TaintGraph::getNode(StringRef Id) const {
    if (const TaintNode *N = findNode(Id))
        return *N;
    throw UnknownNodeError(Id.str());
}

std::vector<unsigned> TaintGraph::getEntryPoints() const {
    std::vector<unsigned> Result;
    for (const auto &N : Nodes)
        if (N->isEntryPoint())
            Result.push_back(N->getIndex());
    return Result;
}

std::vector<unsigned> TaintGraph::getSinks() const {
    std::vector<unsigned> Result;
    for (const auto &N : Nodes)
        if (N->isSink())
            Result.push_back(N->getIndex());
    return Result;
}

BitVector TaintGraph::computeReachingSet(unsigned Target) const {
    BitVector Reaching(getNumNodes());
    SmallVector<unsigned, 32> Worklist;
    Reaching.set(Target);
    Worklist.push_back(Target);
    while (!Worklist.empty()) {
        unsigned Cur = Worklist.pop_back_val();
        for (unsigned EdgeIdx : InEdges[Cur]) {
            unsigned Pred = Edges[EdgeIdx].From;
            if (Reaching.test(Pred))
                continue;
            Reaching.set(Pred);
            Worklist.push_back(Pred);
        }
    }
    return Reaching;
}

void TaintGraph::dump(raw_ostream &OS) const {
    OS << "TaintGraph: " << getNumNodes() << " nodes, " << getNumEdges()
       << " edges\n";
    for (const auto &N : Nodes) {
        OS << "  " << N->getId() << " [" << toString(N->getKind());
        if (N->isEntryPoint())
            OS << (isRegistered(N->getIndex()) ? ", registered" : ", unregistered");
        OS << "]\n";
        for (unsigned EdgeIdx : OutEdges[N->getIndex()]) {
            const TaintEdge &E = Edges[EdgeIdx];
            OS << "    -> " << Nodes[E.To]->getId();
            if (E.Condition != BranchCondition::Always)
                OS << " (" << toString(E.Condition) << ")";
            OS << "\n";
        }
    }
}

} // namespace taintreach
