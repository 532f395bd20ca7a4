#include <gtest/gtest.h>
#include "network/evidence_graph.hpp"

using namespace hegel;

static FuzzyEvidence makeFuzzy(const std::string& id, double value,
                               const std::string& type = "mass_spec") {
    auto now = Clock::now();
    return FuzzyEvidence::fromRawEvidence(id, "lab", type, value, now, now);
}

// ─── Nodes ─────────────────────────────────────────────────────

TEST(EvidenceGraphTest, AddEvidenceStartsNeutral) {
    EvidenceGraph g;
    g.addEvidence(makeFuzzy("a", 0.8));
    ASSERT_EQ(g.nodeCount(), 1u);
    const EvidenceNode* n = g.getNode("a");
    ASSERT_NE(n, nullptr);
    EXPECT_TRUE(n->hasEvidence());
    EXPECT_EQ(n->evidence_type, "mass_spec");
    EXPECT_DOUBLE_EQ(n->prior_probability, 0.5);
    EXPECT_DOUBLE_EQ(n->posterior_probability, 0.5);
    EXPECT_DOUBLE_EQ(n->network_influence, 0.0);
    EXPECT_NEAR(n->confidence(), 0.8, 1e-9);
}

TEST(EvidenceGraphTest, ReAddOverwritesInPlace) {
    EvidenceGraph g;
    g.addEvidence(makeFuzzy("a", 0.3));
    g.addEvidence(makeFuzzy("b", 0.5));
    g.getNode("a")->posterior_probability = 0.9;
    g.addEvidence(makeFuzzy("a", 0.9));

    EXPECT_EQ(g.nodeCount(), 2u);
    ASSERT_EQ(g.nodeIds().size(), 2u);
    EXPECT_EQ(g.nodeIds()[0], "a");
    EXPECT_EQ(g.nodeIds()[1], "b");
    EXPECT_DOUBLE_EQ(g.getNode("a")->fuzzy_evidence->raw_value, 0.9);
    EXPECT_DOUBLE_EQ(g.getNode("a")->posterior_probability, 0.5);
}

TEST(EvidenceGraphTest, PlaceholderHasNoEvidence) {
    EvidenceGraph g;
    g.addPlaceholder("p", "proteomics");
    const EvidenceNode* n = g.getNode("p");
    ASSERT_NE(n, nullptr);
    EXPECT_FALSE(n->hasEvidence());
    EXPECT_EQ(n->evidence_type, "proteomics");
    EXPECT_DOUBLE_EQ(n->confidence(), 0.5);
    EXPECT_DOUBLE_EQ(n->confidence(0.2), 0.2);
}

TEST(EvidenceGraphTest, MissingNode) {
    EvidenceGraph g;
    EXPECT_EQ(g.getNode("nope"), nullptr);
    EXPECT_FALSE(g.hasNode("nope"));
}

// ─── Edges ─────────────────────────────────────────────────────

TEST(EvidenceGraphTest, DanglingEdgeIsStored) {
    EvidenceGraph g;
    g.addEvidence(makeFuzzy("a", 0.8));
    g.addEdge(EvidenceEdge("a", "ghost", EvidenceRelationship::SUPPORTS, 0.5));
    EXPECT_EQ(g.edgeCount(), 1u);
    EXPECT_FALSE(g.isResolved(g.edges()[0]));
    EXPECT_TRUE(g.neighbors("a").empty());
    EXPECT_EQ(g.incidentEdges("a").size(), 1u);
}

TEST(EvidenceGraphTest, NeighborsAreUndirectedAndUnique) {
    EvidenceGraph g;
    g.addEvidence(makeFuzzy("a", 0.8));
    g.addEvidence(makeFuzzy("b", 0.7));
    g.addEvidence(makeFuzzy("c", 0.6));
    g.addEdge(EvidenceEdge("a", "b", EvidenceRelationship::SUPPORTS, 0.9));
    g.addEdge(EvidenceEdge("b", "a", EvidenceRelationship::CORROBORATES, 0.7));
    g.addEdge(EvidenceEdge("c", "a", EvidenceRelationship::CONTRADICTS, 0.4));

    auto na = g.neighbors("a");
    ASSERT_EQ(na.size(), 2u);
    EXPECT_EQ(na[0], "b");
    EXPECT_EQ(na[1], "c");

    auto nb = g.neighbors("b");
    ASSERT_EQ(nb.size(), 1u);
    EXPECT_EQ(nb[0], "a");

    EXPECT_EQ(g.incidentEdges("a").size(), 3u);
    EXPECT_EQ(g.incidentEdges("c").size(), 1u);
}

TEST(EvidenceGraphTest, SelfLoopIsNotANeighbor) {
    EvidenceGraph g;
    g.addEvidence(makeFuzzy("a", 0.8));
    g.addEdge(EvidenceEdge("a", "a", EvidenceRelationship::SUPPORTS, 0.5));
    EXPECT_EQ(g.incidentEdges("a").size(), 1u);
    EXPECT_TRUE(g.neighbors("a").empty());
}

TEST(EvidenceGraphTest, RelationshipNames) {
    EXPECT_EQ(toString(EvidenceRelationship::CORROBORATES), "corroborates");
    EXPECT_EQ(parseRelationship("contradicts").value_or(EvidenceRelationship::SUPPORTS),
              EvidenceRelationship::CONTRADICTS);
    EXPECT_FALSE(parseRelationship("refutes").has_value());
}

// ─── Iteration ─────────────────────────────────────────────────

TEST(EvidenceGraphTest, IterationFollowsInsertionOrder) {
    EvidenceGraph g;
    for (const char* id : {"z", "m", "a", "q"}) {
        g.addEvidence(makeFuzzy(id, 0.5));
    }
    std::vector<std::string> seen;
    g.forEachNode([&](const EvidenceNode& n) { seen.push_back(n.id); });
    EXPECT_EQ(seen, (std::vector<std::string>{"z", "m", "a", "q"}));
}

TEST(EvidenceGraphTest, UpdateEachNodeMutates) {
    EvidenceGraph g;
    g.addEvidence(makeFuzzy("a", 0.5));
    g.addPlaceholder("p", "genomics");
    g.updateEachNode([](EvidenceNode& n) { n.network_influence = 0.25; });
    EXPECT_DOUBLE_EQ(g.getNode("a")->network_influence, 0.25);
    EXPECT_DOUBLE_EQ(g.getNode("p")->network_influence, 0.25);
}

TEST(EvidenceGraphTest, CloneIsIndependent) {
    EvidenceGraph g;
    g.addEvidence(makeFuzzy("a", 0.8));
    EvidenceGraph copy = g.clone();
    copy.getNode("a")->posterior_probability = 0.1;
    copy.addPlaceholder("p", "genomics");
    EXPECT_DOUBLE_EQ(g.getNode("a")->posterior_probability, 0.5);
    EXPECT_EQ(g.nodeCount(), 1u);
    EXPECT_EQ(copy.nodeCount(), 2u);
}

TEST(EvidenceGraphTest, ClearEmptiesEverything) {
    EvidenceGraph g;
    g.addEvidence(makeFuzzy("a", 0.8));
    g.addEvidence(makeFuzzy("b", 0.8));
    g.addEdge(EvidenceEdge("a", "b", EvidenceRelationship::SUPPORTS, 0.5));
    g.clear();
    EXPECT_EQ(g.nodeCount(), 0u);
    EXPECT_EQ(g.edgeCount(), 0u);
    EXPECT_TRUE(g.nodeIds().empty());
    EXPECT_TRUE(g.incidentEdges("a").empty());
}
