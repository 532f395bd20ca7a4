#include "inference/fuzzy_bayesian_network.hpp"
#include "objective/default_objective.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace hegel {

double edgeInfluence(EvidenceRelationship rel, double from_posterior) {
    switch (rel) {
        case EvidenceRelationship::SUPPORTS:     return from_posterior;
        case EvidenceRelationship::CONTRADICTS:  return 1.0 - from_posterior;
        case EvidenceRelationship::CORROBORATES: return from_posterior * 0.8;
        case EvidenceRelationship::IMPLIES:      return from_posterior * 0.9;
        case EvidenceRelationship::REQUIRES:     return from_posterior > 0.5 ? 1.0 : 0.0;
    }
    return 0.0;
}

double bayesianPosterior(double prior, double likelihood) {
    double joint = likelihood * prior;
    double evidence = joint + (1.0 - likelihood) * (1.0 - prior);
    if (evidence <= 0.0) return prior;
    return joint / evidence;
}

FuzzyBayesianNetwork::FuzzyBayesianNetwork(InferenceConfig config)
    : config_(config),
      rules_(defaultFuzzyRules()),
      variables_(VariableRegistry::withDefaults()) {
    objectives_.emplace("default", makeMolecularIdentityObjective());
}

void FuzzyBayesianNetwork::reset() {
    graph_.clear();
    last_results_.clear();
}

void FuzzyBayesianNetwork::setObjective(const std::string& key, ObjectiveFunction objective) {
    objectives_.erase(key);
    objectives_.emplace(key, std::move(objective));
}

// ─── Update cycle ──────────────────────────────────────────────

void FuzzyBayesianNetwork::updateNetwork() {
    spdlog::debug("Updating network: {} nodes, {} edges, {} rules",
                  graph_.nodeCount(), graph_.edgeCount(), rules_.size());
    applyFuzzyRules();
    updateBayesianProbabilities();
    propagateInfluence();
    optimizeWithObjectives();
}

void FuzzyBayesianNetwork::applyFuzzyRules() {
    // Rule state is rebuilt from scratch and summed, so the outcome does
    // not depend on rule order or on how often the cycle runs.
    graph_.updateEachNode([&](EvidenceNode& node) {
        node.rule_adjustment = 0.0;
        node.rule_activations.clear();
        if (!node.hasEvidence()) return;

        for (const auto& rule : rules_) {
            double activation = ruleActivation(rule, *node.fuzzy_evidence, variables_);
            if (activation <= 0.0) continue;
            node.rule_activations[rule.id] = activation;
            node.rule_adjustment += activation * rule.consequent.adjustment;
        }
    });
}

void FuzzyBayesianNetwork::updateBayesianProbabilities() {
    graph_.updateEachNode([&](EvidenceNode& node) {
        if (!node.hasEvidence()) {
            // Nothing observed: belief stays at the prior.
            node.posterior_probability = node.prior_probability;
            return;
        }
        double likelihood = node.fuzzy_evidence->defuzzifiedConfidence();
        node.posterior_probability = bayesianPosterior(node.prior_probability, likelihood);
        if (config_.apply_rule_adjustments && node.rule_adjustment != 0.0) {
            node.posterior_probability =
                std::clamp(node.posterior_probability + node.rule_adjustment, 0.0, 1.0);
        }
    });
}

void FuzzyBayesianNetwork::propagateInfluence() {
    graph_.updateEachNode([](EvidenceNode& node) { node.network_influence = 0.0; });

    size_t skipped = 0;
    for (const auto& edge : graph_.edges()) {
        const EvidenceNode* from = graph_.getNode(edge.from);
        EvidenceNode* to = graph_.getNode(edge.to);
        if (!from || !to) {
            skipped++;
            continue;
        }
        to->network_influence +=
            edgeInfluence(edge.relationship, from->posterior_probability) * edge.strength;
    }
    if (skipped > 0) {
        spdlog::debug("Skipped {} edges with missing endpoints", skipped);
    }
}

void FuzzyBayesianNetwork::optimizeWithObjectives() {
    last_results_.clear();
    for (const auto& [key, objective] : objectives_) {
        ObjectiveResult result = objective.evaluate(graph_, config_.optimization_threshold);
        spdlog::debug("Objective {} scored {:.3f} with {} recommendations",
                      objective.name(), result.total_score, result.recommendations.size());
        for (const auto& rec : result.recommendations) {
            applyRecommendation(graph_, rec);
        }
        last_results_.emplace(key, std::move(result));
    }
}

// ─── Prediction ────────────────────────────────────────────────

std::vector<EvidencePrediction> FuzzyBayesianNetwork::predictMissingEvidence(
    const std::unordered_set<std::string>& known_ids) const {

    std::vector<EvidencePrediction> predictions;
    graph_.forEachNode([&](const EvidenceNode& node) {
        if (known_ids.count(node.id)) return;
        std::vector<std::string> neighbor_ids = graph_.neighbors(node.id);
        if (neighbor_ids.empty()) return;
        predictions.push_back(predictFor(node, neighbor_ids));
    });

    // Most confident first; equal confidences keep graph order.
    std::stable_sort(predictions.begin(), predictions.end(),
                     [](const EvidencePrediction& a, const EvidencePrediction& b) {
                         return a.confidence > b.confidence;
                     });
    return predictions;
}

EvidencePrediction FuzzyBayesianNetwork::predictFor(
    const EvidenceNode& target,
    const std::vector<std::string>& neighbor_ids) const {

    double value = 0.0;
    double confidence = 0.0;
    double total_weight = 0.0;

    for (const auto& nid : neighbor_ids) {
        const EvidenceNode* neighbor = graph_.getNode(nid);
        if (!neighbor || !neighbor->hasEvidence()) continue;
        double weight = neighbor->fuzzy_evidence->defuzzifiedConfidence();
        value += neighbor->fuzzy_evidence->raw_value * weight;
        confidence += weight * weight;
        total_weight += weight;
    }

    EvidencePrediction prediction;
    prediction.node_id = target.id;
    if (total_weight > 0.0) {
        prediction.predicted_value = value / total_weight;
        prediction.confidence = confidence / total_weight;
    }
    prediction.supporting_evidence = neighbor_ids;
    prediction.reasoning = "Predicted based on " + std::to_string(neighbor_ids.size()) +
                           " connected evidence nodes";
    return prediction;
}

} // namespace hegel
