#pragma once

#include "integration/evidence.hpp"
#include "network/edge.hpp"

#include <optional>
#include <utility>

namespace hegel {

/// Edges at or below this strength are noise and never enter the graph.
constexpr double kEdgeNoiseFloor = 0.1;

using InferredRelationship = std::pair<EvidenceRelationship, double>;

/// Relationship and strength between two observed evidence items.
///
/// Same source: a confidence gap under 0.2 corroborates (0.8 - gap),
/// a wider gap contradicts (gap). Different sources compare
/// similarity = 1 - gap: above 0.7 supports (similarity), below 0.3
/// contradicts (1 - similarity), otherwise the evidence-type table decides.
InferredRelationship inferRelationship(const Evidence& a, const Evidence& b);

/// Evidence-type table: genomics → proteomics implies 0.6,
/// proteomics → metabolomics implies 0.5, literature → anything supports 0.4.
std::optional<InferredRelationship> typeRelationship(const std::string& from_type,
                                                     const std::string& to_type);

/// Link from an observed item to an expected one, judged by type only.
/// Either table direction counts; identical types corroborate at 0.5.
std::optional<InferredRelationship> expectedRelationship(const Evidence& observed,
                                                         const ExpectedEvidence& expected);

/// weak / moderate / strong reading of the link between a and b.
MembershipMap fuzzyRelationshipStrength(const Evidence& a, const Evidence& b);

} // namespace hegel
