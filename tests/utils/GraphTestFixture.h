#ifndef TAINTREACH_TESTS_UTILS_GRAPHTESTFIXTURE_H
#define TAINTREACH_TESTS_UTILS_GRAPHTESTFIXTURE_H

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "Analysis/PathEnumerator.h"
#include "Analysis/PathVerdict.h"
#include "Analysis/SinkAggregator.h"
#include "Classifier/NodeClassifier.h"
#include "Graph/TaintGraph.h"

#include "TestConfig.h"

namespace taintreach {
namespace testing {

// ============================================================================
// Base Graph Test Fixture
// ============================================================================

/// Builds a graph in the test body, then classifies and enumerates it.
class GraphTestFixture : public ::testing::Test {
protected:
    TaintGraph Graph;
    std::unique_ptr<ClassifiedGraph> Classified;

    void TearDown() override {
        Classified.reset();
    }

    // Graph construction helpers
    void entry(const std::string& Id, bool Registered = true) {
        Graph.addNode(Id, NodeKind::EntryPoint);
        if (Registered)
            Graph.markEntryRegistered(Id);
    }

    void call(const std::string& Id, TagMap Tags = TagMap()) {
        Graph.addNode(Id, NodeKind::Call, std::move(Tags));
    }

    void branch(const std::string& Id, TagMap Tags = TagMap()) {
        Graph.addNode(Id, NodeKind::Branch, std::move(Tags));
    }

    void sink(const std::string& Id, const std::string& Subtype = "sql") {
        Graph.addNode(Id, NodeKind::Sink, TagMap{{"subtype", Subtype}});
    }

    void edge(const std::string& From, const std::string& To,
              BranchCondition Cond = BranchCondition::Always) {
        Graph.addEdge(From, To, Cond);
    }

    // Classification must happen after the last mutation
    const ClassifiedGraph& classified() {
        if (!Classified)
            Classified = std::make_unique<ClassifiedGraph>(Graph);
        return *Classified;
    }

    unsigned indexOf(const std::string& Id) {
        return Graph.getNode(Id).getIndex();
    }

    std::vector<TaintPath> pathsTo(const std::string& SinkId, size_t MaxPaths = 0) {
        return enumeratePaths(classified(), indexOf(SinkId), MaxPaths).collect();
    }

    std::vector<PathVerdict> verdictsFor(const std::string& SinkId) {
        PathVerdictEngine Engine(classified());
        std::vector<PathVerdict> Verdicts;
        for (const TaintPath& P : pathsTo(SinkId))
            Verdicts.push_back(Engine.classify(P));
        return Verdicts;
    }

    SinkVerdict aggregateFor(const std::string& SinkId,
                             AggregationPolicy Policy = AggregationPolicy()) {
        std::vector<PathVerdict> Verdicts = verdictsFor(SinkId);
        return SinkAggregator(Policy).aggregate(Graph.getNode(SinkId), Verdicts);
    }

    std::vector<std::string> idsOf(const TaintPath& P) {
        std::vector<std::string> Ids;
        for (unsigned N : P.Nodes)
            Ids.push_back(Graph.getNode(N).getId());
        return Ids;
    }
};

} // namespace testing
} // namespace taintreach

#endif // TAINTREACH_TESTS_UTILS_GRAPHTESTFIXTURE_H
