#include "objective/objective_components.hpp"
#include <algorithm>
#include <cmath>

namespace hegel {

double ConfidenceObjective::score(const EvidenceGraph& graph) const {
    double sum = 0.0;
    size_t count = 0;
    graph.forEachNode([&](const EvidenceNode& n) {
        if (!n.hasEvidence()) return;
        sum += n.fuzzy_evidence->defuzzifiedConfidence();
        count++;
    });
    return count > 0 ? sum / static_cast<double>(count) : 0.5;
}

double UncertaintyObjective::score(const EvidenceGraph& graph) const {
    double sum = 0.0;
    size_t count = 0;
    graph.forEachNode([&](const EvidenceNode& n) {
        if (!n.hasEvidence()) return;
        sum += n.fuzzy_evidence->uncertaintyWidth();
        count++;
    });
    if (count == 0) return 1.0;
    return 1.0 - sum / static_cast<double>(count);
}

double ConsistencyObjective::edgeConsistency(EvidenceRelationship rel,
                                             double p_from, double p_to) {
    double diff = std::abs(p_from - p_to);
    switch (rel) {
        case EvidenceRelationship::SUPPORTS:     return 1.0 - diff;
        case EvidenceRelationship::CONTRADICTS:  return diff;
        case EvidenceRelationship::CORROBORATES:
        case EvidenceRelationship::IMPLIES:
        case EvidenceRelationship::REQUIRES:     return 0.5;
    }
    return 0.5;
}

double ConsistencyObjective::score(const EvidenceGraph& graph) const {
    double sum = 0.0;
    size_t count = 0;
    graph.forEachEdge([&](const EvidenceEdge& e) {
        const EvidenceNode* from = graph.getNode(e.from);
        const EvidenceNode* to = graph.getNode(e.to);
        if (!from || !to) return;
        sum += edgeConsistency(e.relationship, from->posterior_probability,
                               to->posterior_probability);
        count++;
    });
    return count > 0 ? sum / static_cast<double>(count) : 0.5;
}

double ConflictObjective::score(const EvidenceGraph& graph) const {
    size_t conflicts = std::count_if(
        graph.edges().begin(), graph.edges().end(),
        [](const EvidenceEdge& e) { return e.relationship == EvidenceRelationship::CONTRADICTS; });
    size_t total = std::max<size_t>(graph.edgeCount(), 1);
    return 1.0 - static_cast<double>(conflicts) / static_cast<double>(total);
}

double CoherenceObjective::score(const EvidenceGraph& graph) const {
    double nodes = static_cast<double>(std::max<size_t>(graph.nodeCount(), 1));
    double connectivity = static_cast<double>(graph.edgeCount()) / (nodes * nodes);
    double consistency = ConsistencyObjective("consistency").score(graph);
    return (connectivity + consistency) / 2.0;
}

} // namespace hegel
