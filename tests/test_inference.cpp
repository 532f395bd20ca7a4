#include <gtest/gtest.h>
#include "inference/fuzzy_bayesian_network.hpp"

#include <algorithm>

using namespace hegel;

static FuzzyEvidence makeFuzzy(const std::string& id, double value) {
    auto now = Clock::now();
    return FuzzyEvidence::fromRawEvidence(id, "lab", "mass_spec", value, now, now);
}

static FuzzyBayesianNetwork networkWithoutObjectives(InferenceConfig config = {}) {
    FuzzyBayesianNetwork net(config);
    net.clearObjectives();
    return net;
}

// ─── Building blocks ───────────────────────────────────────────

TEST(InferenceTest, EdgeInfluenceTable) {
    EXPECT_DOUBLE_EQ(edgeInfluence(EvidenceRelationship::SUPPORTS, 0.7), 0.7);
    EXPECT_NEAR(edgeInfluence(EvidenceRelationship::CONTRADICTS, 0.7), 0.3, 1e-12);
    EXPECT_NEAR(edgeInfluence(EvidenceRelationship::CORROBORATES, 0.7), 0.56, 1e-12);
    EXPECT_NEAR(edgeInfluence(EvidenceRelationship::IMPLIES, 0.7), 0.63, 1e-12);
    EXPECT_DOUBLE_EQ(edgeInfluence(EvidenceRelationship::REQUIRES, 0.7), 1.0);
    EXPECT_DOUBLE_EQ(edgeInfluence(EvidenceRelationship::REQUIRES, 0.5), 0.0);
}

TEST(InferenceTest, BayesianPosterior) {
    EXPECT_NEAR(bayesianPosterior(0.5, 0.8), 0.8, 1e-12);
    EXPECT_NEAR(bayesianPosterior(0.3, 0.9), 0.27 / 0.34, 1e-12);
    // Vanishing evidence term keeps the prior.
    EXPECT_DOUBLE_EQ(bayesianPosterior(1.0, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(bayesianPosterior(0.0, 1.0), 0.0);
}

TEST(InferenceTest, PosteriorStaysInUnitInterval) {
    for (double prior = 0.0; prior <= 1.0001; prior += 0.1) {
        for (double lik = 0.0; lik <= 1.0001; lik += 0.1) {
            double p = bayesianPosterior(std::min(prior, 1.0), std::min(lik, 1.0));
            EXPECT_GE(p, 0.0);
            EXPECT_LE(p, 1.0);
        }
    }
}

// ─── Update cycle ──────────────────────────────────────────────

TEST(InferenceTest, EmptyGraphUpdateIsTotal) {
    FuzzyBayesianNetwork net;
    net.updateNetwork();
    EXPECT_EQ(net.graph().nodeCount(), 0u);
    EXPECT_EQ(net.lastObjectiveResults().size(), 1u);
}

TEST(InferenceTest, BayesianUpdateWithoutObjectives) {
    auto net = networkWithoutObjectives();
    net.addEvidence(makeFuzzy("a", 0.8));
    net.updateNetwork();
    EXPECT_NEAR(net.graph().getNode("a")->posterior_probability, 0.8, 1e-9);
    EXPECT_TRUE(net.lastObjectiveResults().empty());
}

TEST(InferenceTest, DefaultObjectiveNudgesLoneNode) {
    FuzzyBayesianNetwork net;
    net.addEvidence(makeFuzzy("a", 0.8));
    net.updateNetwork();
    // Coherence of a lone node is 0.25, so the global +0.1 applies once.
    EXPECT_NEAR(net.graph().getNode("a")->posterior_probability, 0.9, 1e-9);

    const auto& results = net.lastObjectiveResults();
    ASSERT_EQ(results.count("default"), 1u);
    EXPECT_EQ(results.at("default").recommendations.size(), 1u);
}

TEST(InferenceTest, PlaceholderPosteriorResetsToPrior) {
    auto net = networkWithoutObjectives();
    net.addPlaceholder("p", "proteomics");
    net.graph().getNode("p")->posterior_probability = 0.9;
    net.updateNetwork();
    EXPECT_DOUBLE_EQ(net.graph().getNode("p")->posterior_probability, 0.5);
}

TEST(InferenceTest, InfluenceSumsIncomingEdges) {
    auto net = networkWithoutObjectives();
    net.addEvidence(makeFuzzy("a", 0.8));
    net.addEvidence(makeFuzzy("b", 0.8));
    net.addEvidence(makeFuzzy("c", 0.8));
    net.addEdge(EvidenceEdge("a", "b", EvidenceRelationship::SUPPORTS, 0.5));
    net.addEdge(EvidenceEdge("c", "b", EvidenceRelationship::CONTRADICTS, 1.0));
    net.addEdge(EvidenceEdge("ghost", "b", EvidenceRelationship::SUPPORTS, 1.0));
    net.addEdge(EvidenceEdge("b", "ghost", EvidenceRelationship::SUPPORTS, 1.0));
    net.updateNetwork();

    // 0.8·0.5 + (1 - 0.8)·1; dangling edges contribute nothing.
    EXPECT_NEAR(net.graph().getNode("b")->network_influence, 0.6, 1e-9);
    EXPECT_DOUBLE_EQ(net.graph().getNode("a")->network_influence, 0.0);
    EXPECT_DOUBLE_EQ(net.graph().getNode("c")->network_influence, 0.0);
}

TEST(InferenceTest, UpdateIsIdempotent) {
    FuzzyBayesianNetwork net;
    net.addEvidence(makeFuzzy("a", 0.8));
    net.addEvidence(makeFuzzy("b", 0.35));
    net.addEvidence(makeFuzzy("c", 0.65));
    net.addPlaceholder("p", "proteomics");
    net.addEdge(EvidenceEdge("a", "b", EvidenceRelationship::CONTRADICTS, 0.45));
    net.addEdge(EvidenceEdge("a", "c", EvidenceRelationship::SUPPORTS, 0.85));
    net.addEdge(EvidenceEdge("c", "p", EvidenceRelationship::IMPLIES, 0.6));

    net.updateNetwork();
    EvidenceGraph first = net.graph().clone();
    net.updateNetwork();

    for (const auto& id : first.nodeIds()) {
        const EvidenceNode* before = first.getNode(id);
        const EvidenceNode* after = net.graph().getNode(id);
        ASSERT_NE(after, nullptr);
        EXPECT_DOUBLE_EQ(before->posterior_probability, after->posterior_probability) << id;
        EXPECT_DOUBLE_EQ(before->network_influence, after->network_influence) << id;
        EXPECT_DOUBLE_EQ(before->rule_adjustment, after->rule_adjustment) << id;
        EXPECT_GE(after->posterior_probability, 0.0);
        EXPECT_LE(after->posterior_probability, 1.0);
    }
}

// ─── Fuzzy rules ───────────────────────────────────────────────

TEST(InferenceTest, RuleActivationsRecorded) {
    auto net = networkWithoutObjectives();
    net.addEvidence(makeFuzzy("a", 0.7));
    net.updateNetwork();

    const EvidenceNode* n = net.graph().getNode("a");
    ASSERT_EQ(n->rule_activations.size(), 1u);
    EXPECT_NEAR(n->rule_activations.at("high_confidence_support"), 0.5, 1e-9);
    EXPECT_NEAR(n->rule_adjustment, 0.05, 1e-9);
    // Recorded only: posterior is the plain Bayesian update.
    EXPECT_NEAR(n->posterior_probability, 0.68, 1e-9);
}

TEST(InferenceTest, RuleOrderDoesNotMatter) {
    auto ev = makeFuzzy("a", 0.7);
    ev.setAgreement(0.1, LinguisticVariable::evidenceAgreement());

    auto forward = networkWithoutObjectives();
    forward.addEvidence(ev);
    forward.updateNetwork();

    auto reversed = networkWithoutObjectives();
    auto rules = defaultFuzzyRules();
    std::reverse(rules.begin(), rules.end());
    reversed.setRules(rules);
    reversed.addEvidence(ev);
    reversed.updateNetwork();

    double expected = 0.5 * 0.1 + 1.0 * -0.2;
    EXPECT_NEAR(forward.graph().getNode("a")->rule_adjustment, expected, 1e-9);
    EXPECT_NEAR(reversed.graph().getNode("a")->rule_adjustment, expected, 1e-9);
    EXPECT_EQ(forward.graph().getNode("a")->rule_activations,
              reversed.graph().getNode("a")->rule_activations);
}

TEST(InferenceTest, AppliedRuleAdjustment) {
    InferenceConfig config;
    config.apply_rule_adjustments = true;
    auto net = networkWithoutObjectives(config);
    net.addEvidence(makeFuzzy("a", 0.7));
    net.updateNetwork();
    EXPECT_NEAR(net.graph().getNode("a")->posterior_probability, 0.73, 1e-9);

    net.updateNetwork();
    EXPECT_NEAR(net.graph().getNode("a")->posterior_probability, 0.73, 1e-9);
}

TEST(InferenceTest, AddedRuleParticipates) {
    auto net = networkWithoutObjectives();
    FuzzyRule low;
    low.id = "low_confidence_caution";
    low.antecedent = {{"confidence", "medium", FuzzyOperator::LESS_THAN}};
    low.consequent = {"posterior", "decrease", -0.1};
    net.addRule(low);
    EXPECT_EQ(net.rules().size(), 3u);

    net.addEvidence(makeFuzzy("a", 0.3));
    net.updateNetwork();
    EXPECT_NEAR(net.graph().getNode("a")->rule_activations.at("low_confidence_caution"), 0.5,
                1e-9);
}

// ─── Prediction ────────────────────────────────────────────────

TEST(InferenceTest, PredictFromSingleNeighbor) {
    FuzzyBayesianNetwork net;
    net.addEvidence(makeFuzzy("a", 0.8));
    net.addPlaceholder("p", "proteomics");
    net.addEdge(EvidenceEdge("a", "p", EvidenceRelationship::IMPLIES, 0.6));
    net.updateNetwork();

    auto predictions = net.predictMissingEvidence({"a"});
    ASSERT_EQ(predictions.size(), 1u);
    const auto& p = predictions[0];
    EXPECT_EQ(p.node_id, "p");
    EXPECT_NEAR(p.predicted_value, 0.8, 1e-9);
    EXPECT_NEAR(p.confidence, 0.8, 1e-9);
    ASSERT_EQ(p.supporting_evidence.size(), 1u);
    EXPECT_EQ(p.supporting_evidence[0], "a");
    EXPECT_EQ(p.reasoning, "Predicted based on 1 connected evidence nodes");
}

TEST(InferenceTest, PredictionBoundedByNeighborConfidence) {
    FuzzyBayesianNetwork net;
    net.addEvidence(makeFuzzy("a", 0.9));
    net.addEvidence(makeFuzzy("b", 0.4));
    net.addEvidence(makeFuzzy("c", 0.65));
    net.addPlaceholder("p", "proteomics");
    for (const char* id : {"a", "b", "c"}) {
        net.addEdge(EvidenceEdge(id, "p", EvidenceRelationship::IMPLIES, 0.6));
    }
    net.updateNetwork();

    double max_conf = 0.0;
    for (const char* id : {"a", "b", "c"}) {
        max_conf = std::max(max_conf, net.graph().getNode(id)->confidence());
    }
    auto predictions = net.predictMissingEvidence({"a", "b", "c"});
    ASSERT_EQ(predictions.size(), 1u);
    EXPECT_GT(predictions[0].confidence, 0.0);
    EXPECT_LE(predictions[0].confidence, max_conf + 1e-12);
    EXPECT_EQ(predictions[0].supporting_evidence.size(), 3u);
}

TEST(InferenceTest, IsolatedOrKnownNodesNotPredicted) {
    FuzzyBayesianNetwork net;
    net.addEvidence(makeFuzzy("a", 0.8));
    net.addEvidence(makeFuzzy("b", 0.7));
    net.addPlaceholder("lonely", "proteomics");
    net.addEdge(EvidenceEdge("a", "b", EvidenceRelationship::SUPPORTS, 0.9));
    net.updateNetwork();

    EXPECT_TRUE(net.predictMissingEvidence({"a", "b"}).empty());

    // Unknown ids that do have neighbours are predicted.
    auto predictions = net.predictMissingEvidence({"a"});
    ASSERT_EQ(predictions.size(), 1u);
    EXPECT_EQ(predictions[0].node_id, "b");
}

TEST(InferenceTest, PredictionsMostConfidentFirst) {
    FuzzyBayesianNetwork net;
    net.addPlaceholder("p_weak", "proteomics");
    net.addPlaceholder("p_strong", "proteomics");
    net.addEvidence(makeFuzzy("m", 0.5));
    net.addEvidence(makeFuzzy("a", 0.8));
    net.addEdge(EvidenceEdge("m", "p_weak", EvidenceRelationship::IMPLIES, 0.6));
    net.addEdge(EvidenceEdge("a", "p_strong", EvidenceRelationship::IMPLIES, 0.6));
    net.updateNetwork();

    auto predictions = net.predictMissingEvidence({"m", "a"});
    ASSERT_EQ(predictions.size(), 2u);
    EXPECT_EQ(predictions[0].node_id, "p_strong");
    EXPECT_EQ(predictions[1].node_id, "p_weak");
    EXPECT_NEAR(predictions[1].confidence, 0.5, 1e-9);
}

TEST(InferenceTest, NeighborsWithoutEvidenceGiveZeroConfidence) {
    FuzzyBayesianNetwork net;
    net.addPlaceholder("p", "proteomics");
    net.addPlaceholder("q", "metabolomics");
    net.addEdge(EvidenceEdge("p", "q", EvidenceRelationship::IMPLIES, 0.5));
    net.updateNetwork();

    auto predictions = net.predictMissingEvidence({});
    ASSERT_EQ(predictions.size(), 2u);
    for (const auto& p : predictions) {
        EXPECT_DOUBLE_EQ(p.confidence, 0.0);
        EXPECT_DOUBLE_EQ(p.predicted_value, 0.0);
    }
}

TEST(InferenceTest, ResetKeepsConfiguration) {
    FuzzyBayesianNetwork net;
    net.addEvidence(makeFuzzy("a", 0.8));
    net.updateNetwork();
    net.reset();
    EXPECT_EQ(net.graph().nodeCount(), 0u);
    EXPECT_TRUE(net.lastObjectiveResults().empty());
    EXPECT_EQ(net.rules().size(), 2u);
    EXPECT_EQ(net.objectiveCount(), 1u);
    EXPECT_TRUE(net.variables().contains("confidence"));
}
