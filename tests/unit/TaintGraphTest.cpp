#include <gtest/gtest.h>
#include <llvm/Support/raw_ostream.h>

#include <Graph/GraphError.h>
#include <Graph/TaintGraph.h>

using namespace taintreach;

// ============================================================================
// TaintGraph Unit Tests
// ============================================================================

class TaintGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        G.addNode("login", NodeKind::EntryPoint);
        G.addNode("check", NodeKind::Branch);
        G.addNode("render", NodeKind::Call);
        G.addNode("exec", NodeKind::Sink, TagMap{{"subtype", "sql"}});
        G.addNode("unused", NodeKind::Call);
    }

    TaintGraph G;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(TaintGraphTest, NodesKeepDeclarationOrder) {
    ASSERT_EQ(G.getNumNodes(), 5u);
    EXPECT_EQ(G.getNode(0u).getId(), "login");
    EXPECT_EQ(G.getNode(3u).getId(), "exec");
    EXPECT_EQ(G.getNode("render").getIndex(), 2u) << "Index is the insertion position";
    EXPECT_EQ(G.getNode("exec").getTag("subtype").getValue(), "sql");
    EXPECT_FALSE(G.getNode("exec").getTag("role").hasValue());
}

TEST_F(TaintGraphTest, DuplicateNodeIsRejected) {
    try {
        G.addNode("check", NodeKind::Call);
        FAIL() << "Duplicate id should throw";
    } catch (const DuplicateNodeError &E) {
        EXPECT_EQ(E.getElementId(), "check");
    }
    EXPECT_EQ(G.getNumNodes(), 5u) << "Failed insertion must not change the graph";
}

TEST_F(TaintGraphTest, DanglingEdgeNamesMissingNode) {
    try {
        G.addEdge("login", "ghost");
        FAIL() << "Edge to an unknown node should throw";
    } catch (const DanglingEdgeError &E) {
        EXPECT_EQ(E.getElementId(), "ghost");
        EXPECT_EQ(E.getFrom(), "login");
        EXPECT_EQ(E.getTo(), "ghost");
    }

    EXPECT_THROW(G.addEdge("nowhere", "exec"), DanglingEdgeError);
    EXPECT_EQ(G.getNumEdges(), 0u);
}

TEST_F(TaintGraphTest, SelfLoopsAndBackEdgesAreAccepted) {
    G.addEdge("login", "check");
    G.addEdge("check", "check", BranchCondition::Runtime);
    G.addEdge("check", "login");
    EXPECT_EQ(G.getNumEdges(), 3u);
    EXPECT_EQ(G.getOutEdges(G.getNode("check").getIndex()).size(), 2u);
}

TEST_F(TaintGraphTest, Registration) {
    G.markEntryRegistered("login");
    EXPECT_TRUE(G.isRegistered(G.getNode("login").getIndex()));

    EXPECT_THROW(G.markEntryRegistered("ghost"), UnknownNodeError);
    EXPECT_THROW(G.markEntryRegistered("render"), StructuralGraphError)
        << "Only EntryPoint nodes can be registered";
}

TEST_F(TaintGraphTest, UnregisteredByDefault) {
    EXPECT_FALSE(G.isRegistered(G.getNode("login").getIndex()));
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(TaintGraphTest, OutEdgesInDeclarationOrder) {
    G.addEdge("check", "render");
    G.addEdge("check", "exec", BranchCondition::Never);
    G.addEdge("check", "unused");

    unsigned Check = G.getNode("check").getIndex();
    llvm::ArrayRef<unsigned> Out = G.getOutEdges(Check);
    ASSERT_EQ(Out.size(), 3u);
    EXPECT_EQ(G.getNode(G.getEdge(Out[0]).To).getId(), "render");
    EXPECT_EQ(G.getNode(G.getEdge(Out[1]).To).getId(), "exec");
    EXPECT_EQ(G.getEdge(Out[1]).Condition, BranchCondition::Never);
    EXPECT_EQ(G.getNode(G.getEdge(Out[2]).To).getId(), "unused");
}

TEST_F(TaintGraphTest, EntryPointsAndSinks) {
    G.addNode("admin", NodeKind::EntryPoint);
    G.addNode("render_tpl", NodeKind::Sink);

    std::vector<unsigned> Entries = G.getEntryPoints();
    ASSERT_EQ(Entries.size(), 2u);
    EXPECT_EQ(G.getNode(Entries[0]).getId(), "login");
    EXPECT_EQ(G.getNode(Entries[1]).getId(), "admin");

    std::vector<unsigned> Sinks = G.getSinks();
    ASSERT_EQ(Sinks.size(), 2u);
    EXPECT_EQ(G.getNode(Sinks[0]).getId(), "exec");
    EXPECT_EQ(G.getNode(Sinks[1]).getId(), "render_tpl");
}

TEST_F(TaintGraphTest, ReachingSetIgnoresConditions) {
    G.addEdge("login", "check");
    G.addEdge("check", "render", BranchCondition::Never);
    G.addEdge("render", "exec");
    G.addEdge("exec", "unused");

    llvm::BitVector R = G.computeReachingSet(G.getNode("exec").getIndex());
    EXPECT_TRUE(R.test(G.getNode("login").getIndex()));
    EXPECT_TRUE(R.test(G.getNode("check").getIndex()));
    EXPECT_TRUE(R.test(G.getNode("render").getIndex()));
    EXPECT_TRUE(R.test(G.getNode("exec").getIndex())) << "Target is in its own set";
    EXPECT_FALSE(R.test(G.getNode("unused").getIndex())) << "Successors do not reach the target";
}

TEST_F(TaintGraphTest, UnknownLookup) {
    EXPECT_EQ(G.findNode("ghost"), nullptr);
    EXPECT_THROW(G.getNode(llvm::StringRef("ghost")), UnknownNodeError);
}

TEST_F(TaintGraphTest, ParseNames) {
    EXPECT_EQ(parseNodeKind("entrypoint").getValue(), NodeKind::EntryPoint);
    EXPECT_EQ(parseNodeKind("SINK").getValue(), NodeKind::Sink);
    EXPECT_FALSE(parseNodeKind("lambda").hasValue());

    EXPECT_EQ(parseBranchCondition("Never").getValue(), BranchCondition::Never);
    EXPECT_EQ(parseBranchCondition("runtime").getValue(), BranchCondition::Runtime);
    EXPECT_FALSE(parseBranchCondition("sometimes").hasValue());
}

TEST_F(TaintGraphTest, DumpListsNodesAndEdges) {
    G.addEdge("login", "exec", BranchCondition::Runtime);
    std::string Out;
    llvm::raw_string_ostream OS(Out);
    G.dump(OS);
    OS.flush();
    EXPECT_NE(Out.find("login"), std::string::npos);
    EXPECT_NE(Out.find("exec"), std::string::npos);
}
