#pragma once

#include "fuzzy/fuzzy_rule.hpp"
#include "fuzzy/linguistic_variable.hpp"
#include "network/evidence_graph.hpp"
#include "objective/objective.hpp"

#include <map>
#include <string>
#include <unordered_set>
#include <vector>

namespace hegel {

/// Estimate for an evidence item that was never collected.
struct EvidencePrediction {
    std::string node_id;
    double predicted_value = 0.0;
    double confidence = 0.0;
    std::vector<std::string> supporting_evidence;
    std::string reasoning;
};

struct InferenceConfig {
    /// Add each node's summed rule adjustment to its posterior after the
    /// Bayesian update. Off: rule activations are recorded only.
    bool apply_rule_adjustments = false;
    /// Objective components scoring below this produce recommendations.
    double optimization_threshold = 0.5;
};

/// Influence a from-node with the given posterior exerts along an edge.
double edgeInfluence(EvidenceRelationship rel, double from_posterior);

/// Binary Bayes update with P(E|H) = likelihood and P(E|¬H) = 1 - likelihood.
/// Returns prior unchanged when the evidence term vanishes.
double bayesianPosterior(double prior, double likelihood);

// ─── Fuzzy-Bayesian Network ────────────────────────────────────
// Evidence graph plus the machinery that updates it. One update cycle is
// a fixed pipeline:
//   1. fuzzy rules      → per-node rule activations and adjustment
//   2. Bayesian update  → posterior from prior and defuzzified confidence
//   3. propagation      → network influence along edges
//   4. optimization     → objective-driven posterior adjustments
// Every phase is total: an empty graph or a dangling edge is not an error.

class FuzzyBayesianNetwork {
public:
    explicit FuzzyBayesianNetwork(InferenceConfig config = {});

    FuzzyBayesianNetwork(FuzzyBayesianNetwork&&) = default;
    FuzzyBayesianNetwork& operator=(FuzzyBayesianNetwork&&) = default;

    // ── Graph ──
    void addEvidence(FuzzyEvidence evidence) { graph_.addEvidence(std::move(evidence)); }
    void addPlaceholder(const std::string& id, const std::string& type) {
        graph_.addPlaceholder(id, type);
    }
    void addEdge(EvidenceEdge edge) { graph_.addEdge(std::move(edge)); }
    EvidenceGraph& graph() { return graph_; }
    const EvidenceGraph& graph() const { return graph_; }

    /// Drop all nodes and edges; rules, variables and objectives stay.
    void reset();

    // ── Inference ──
    void updateNetwork();

    /// Predictions for every node not in known_ids that has at least one
    /// neighbour, most confident first.
    std::vector<EvidencePrediction> predictMissingEvidence(
        const std::unordered_set<std::string>& known_ids) const;

    // ── Configuration ──
    void addRule(FuzzyRule rule) { rules_.push_back(std::move(rule)); }
    void setRules(std::vector<FuzzyRule> rules) { rules_ = std::move(rules); }
    const std::vector<FuzzyRule>& rules() const { return rules_; }

    VariableRegistry& variables() { return variables_; }
    const VariableRegistry& variables() const { return variables_; }

    void setObjective(const std::string& key, ObjectiveFunction objective);
    void clearObjectives() { objectives_.clear(); }
    size_t objectiveCount() const { return objectives_.size(); }

    const InferenceConfig& config() const { return config_; }
    void setConfig(const InferenceConfig& config) { config_ = config; }

    /// Objective evaluations from the most recent update, by objective key.
    const std::map<std::string, ObjectiveResult>& lastObjectiveResults() const {
        return last_results_;
    }

private:
    InferenceConfig config_;
    EvidenceGraph graph_;
    std::vector<FuzzyRule> rules_;
    VariableRegistry variables_;
    std::map<std::string, ObjectiveFunction> objectives_;
    std::map<std::string, ObjectiveResult> last_results_;

    void applyFuzzyRules();
    void updateBayesianProbabilities();
    void propagateInfluence();
    void optimizeWithObjectives();

    EvidencePrediction predictFor(const EvidenceNode& target,
                                  const std::vector<std::string>& neighbor_ids) const;
};

} // namespace hegel
