#pragma once

#include "fuzzy/linguistic_variable.hpp"
#include <optional>
#include <string>

namespace hegel {

/// How one evidence item bears on another. Closed set: every formula
/// over relationships switches on it exhaustively.
enum class EvidenceRelationship {
    SUPPORTS,
    CONTRADICTS,
    CORROBORATES,
    IMPLIES,
    REQUIRES
};

std::string toString(EvidenceRelationship rel);
std::optional<EvidenceRelationship> parseRelationship(const std::string& name);

/// A directed edge from → to with a typed relationship and strength in [0,1].
/// fuzzy_strength holds the weak/moderate/strong reading of the same link.
struct EvidenceEdge {
    std::string from;
    std::string to;
    EvidenceRelationship relationship = EvidenceRelationship::SUPPORTS;
    double strength = 0.0;
    MembershipMap fuzzy_strength;

    EvidenceEdge() = default;
    EvidenceEdge(std::string from, std::string to, EvidenceRelationship rel, double strength)
        : from(std::move(from)), to(std::move(to)), relationship(rel), strength(strength) {}
};

} // namespace hegel
