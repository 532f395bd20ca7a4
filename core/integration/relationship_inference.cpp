#include "integration/relationship_inference.hpp"
#include <cmath>

namespace hegel {

InferredRelationship inferRelationship(const Evidence& a, const Evidence& b) {
    double diff = std::abs(a.confidence - b.confidence);

    if (a.source == b.source) {
        if (diff < 0.2) return {EvidenceRelationship::CORROBORATES, 0.8 - diff};
        return {EvidenceRelationship::CONTRADICTS, diff};
    }

    double similarity = 1.0 - diff;
    if (similarity > 0.7) return {EvidenceRelationship::SUPPORTS, similarity};
    if (similarity < 0.3) return {EvidenceRelationship::CONTRADICTS, 1.0 - similarity};

    if (auto typed = typeRelationship(a.evidence_type, b.evidence_type)) {
        return *typed;
    }
    return {EvidenceRelationship::SUPPORTS, similarity};
}

std::optional<InferredRelationship> typeRelationship(const std::string& from_type,
                                                     const std::string& to_type) {
    if (from_type == "genomics" && to_type == "proteomics") {
        return InferredRelationship{EvidenceRelationship::IMPLIES, 0.6};
    }
    if (from_type == "proteomics" && to_type == "metabolomics") {
        return InferredRelationship{EvidenceRelationship::IMPLIES, 0.5};
    }
    if (from_type == "literature") {
        return InferredRelationship{EvidenceRelationship::SUPPORTS, 0.4};
    }
    return std::nullopt;
}

std::optional<InferredRelationship> expectedRelationship(const Evidence& observed,
                                                         const ExpectedEvidence& expected) {
    if (auto forward = typeRelationship(observed.evidence_type, expected.evidence_type)) {
        return forward;
    }
    if (auto backward = typeRelationship(expected.evidence_type, observed.evidence_type)) {
        return backward;
    }
    if (!observed.evidence_type.empty() && observed.evidence_type == expected.evidence_type) {
        return InferredRelationship{EvidenceRelationship::CORROBORATES, 0.5};
    }
    return std::nullopt;
}

MembershipMap fuzzyRelationshipStrength(const Evidence& a, const Evidence& b) {
    double diff = std::abs(a.confidence - b.confidence);
    double mean = (a.confidence + b.confidence) / 2.0;

    MembershipMap strength;
    strength["weak"] = diff > 0.5 ? 1.0 : diff * 2.0;
    strength["moderate"] = (diff < 0.3 && mean > 0.4) ? 1.0 : 0.5;
    strength["strong"] = (diff < 0.1 && mean > 0.7) ? 1.0 : 0.0;
    return strength;
}

} // namespace hegel
