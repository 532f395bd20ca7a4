#include "network/edge.hpp"

namespace hegel {

std::string toString(EvidenceRelationship rel) {
    switch (rel) {
        case EvidenceRelationship::SUPPORTS:     return "supports";
        case EvidenceRelationship::CONTRADICTS:  return "contradicts";
        case EvidenceRelationship::CORROBORATES: return "corroborates";
        case EvidenceRelationship::IMPLIES:      return "implies";
        case EvidenceRelationship::REQUIRES:     return "requires";
    }
    return "unknown";
}

std::optional<EvidenceRelationship> parseRelationship(const std::string& name) {
    if (name == "supports")     return EvidenceRelationship::SUPPORTS;
    if (name == "contradicts")  return EvidenceRelationship::CONTRADICTS;
    if (name == "corroborates") return EvidenceRelationship::CORROBORATES;
    if (name == "implies")      return EvidenceRelationship::IMPLIES;
    if (name == "requires")     return EvidenceRelationship::REQUIRES;
    return std::nullopt;
}

} // namespace hegel
