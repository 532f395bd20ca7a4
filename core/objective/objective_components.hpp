#pragma once

#include "objective/objective.hpp"

namespace hegel {

/// Mean defuzzified confidence of nodes that carry evidence.
class ConfidenceObjective : public ObjectiveComponent {
public:
    using ObjectiveComponent::ObjectiveComponent;
    double score(const EvidenceGraph& graph) const override;
    ObjectiveKind kind() const override { return ObjectiveKind::MAXIMIZE_CONFIDENCE; }
};

/// 1 - mean width of the uncertainty intervals.
class UncertaintyObjective : public ObjectiveComponent {
public:
    using ObjectiveComponent::ObjectiveComponent;
    double score(const EvidenceGraph& graph) const override;
    ObjectiveKind kind() const override { return ObjectiveKind::MINIMIZE_UNCERTAINTY; }
};

/// Agreement of posteriors along supporting and contradicting edges.
class ConsistencyObjective : public ObjectiveComponent {
public:
    using ObjectiveComponent::ObjectiveComponent;
    double score(const EvidenceGraph& graph) const override;
    ObjectiveKind kind() const override { return ObjectiveKind::MAXIMIZE_CONSISTENCY; }

    /// Consistency of one edge given both posteriors.
    static double edgeConsistency(EvidenceRelationship rel, double p_from, double p_to);
};

/// 1 - share of contradicting edges.
class ConflictObjective : public ObjectiveComponent {
public:
    using ObjectiveComponent::ObjectiveComponent;
    double score(const EvidenceGraph& graph) const override;
    ObjectiveKind kind() const override { return ObjectiveKind::MINIMIZE_CONFLICTS; }
};

/// Mean of connectivity (edges / nodes²) and consistency.
class CoherenceObjective : public ObjectiveComponent {
public:
    using ObjectiveComponent::ObjectiveComponent;
    double score(const EvidenceGraph& graph) const override;
    ObjectiveKind kind() const override { return ObjectiveKind::MAXIMIZE_NETWORK_COHERENCE; }
};

} // namespace hegel
