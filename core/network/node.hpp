#pragma once

#include "fuzzy/fuzzy_evidence.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace hegel {

/// A node of the evidence graph: one evidence item and its belief state.
/// A node without fuzzy evidence stands for evidence that is expected
/// but was never collected.
struct EvidenceNode {
    std::string id;
    std::string evidence_type;
    std::optional<FuzzyEvidence> fuzzy_evidence;
    double prior_probability = 0.5;
    double posterior_probability = 0.5;
    double network_influence = 0.0;     // recomputed every inference cycle

    // Fuzzy rule state, recomputed every inference cycle
    double rule_adjustment = 0.0;
    std::unordered_map<std::string, double> rule_activations;

    EvidenceNode() = default;
    EvidenceNode(std::string id, std::string evidence_type)
        : id(std::move(id)), evidence_type(std::move(evidence_type)) {}

    bool hasEvidence() const { return fuzzy_evidence.has_value(); }

    /// Defuzzified confidence, or fallback when there is no evidence.
    double confidence(double fallback = 0.5) const {
        return fuzzy_evidence ? fuzzy_evidence->defuzzifiedConfidence() : fallback;
    }
};

} // namespace hegel
