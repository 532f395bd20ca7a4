#include "objective/objective.hpp"
#include "objective/objective_components.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace hegel {

std::string toString(ObjectiveKind kind) {
    switch (kind) {
        case ObjectiveKind::MAXIMIZE_CONFIDENCE:        return "maximize_confidence";
        case ObjectiveKind::MINIMIZE_UNCERTAINTY:       return "minimize_uncertainty";
        case ObjectiveKind::MAXIMIZE_CONSISTENCY:       return "maximize_consistency";
        case ObjectiveKind::MINIMIZE_CONFLICTS:         return "minimize_conflicts";
        case ObjectiveKind::MAXIMIZE_NETWORK_COHERENCE: return "maximize_network_coherence";
    }
    return "unknown";
}

std::string toString(OptimizationAction action) {
    switch (action) {
        case OptimizationAction::ADJUST_CONFIDENCE: return "adjust_confidence";
        case OptimizationAction::ADD_EDGE:          return "add_edge";
        case OptimizationAction::REMOVE_EDGE:       return "remove_edge";
        case OptimizationAction::UPDATE_WEIGHT:     return "update_weight";
    }
    return "unknown";
}

std::unique_ptr<ObjectiveComponent> makeObjectiveComponent(ObjectiveKind kind,
                                                           const std::string& name) {
    switch (kind) {
        case ObjectiveKind::MAXIMIZE_CONFIDENCE:
            return std::make_unique<ConfidenceObjective>(name);
        case ObjectiveKind::MINIMIZE_UNCERTAINTY:
            return std::make_unique<UncertaintyObjective>(name);
        case ObjectiveKind::MAXIMIZE_CONSISTENCY:
            return std::make_unique<ConsistencyObjective>(name);
        case ObjectiveKind::MINIMIZE_CONFLICTS:
            return std::make_unique<ConflictObjective>(name);
        case ObjectiveKind::MAXIMIZE_NETWORK_COHERENCE:
            return std::make_unique<CoherenceObjective>(name);
    }
    return nullptr;
}

// ─── Objective Function ────────────────────────────────────────

void ObjectiveFunction::addComponent(std::unique_ptr<ObjectiveComponent> component,
                                     double weight) {
    weights_[component->name()] = weight;
    components_.push_back(std::move(component));
}

void ObjectiveFunction::addComponent(std::unique_ptr<ObjectiveComponent> component) {
    components_.push_back(std::move(component));
}

double ObjectiveFunction::weight(const std::string& component) const {
    auto it = weights_.find(component);
    return it != weights_.end() ? it->second : 1.0;
}

ObjectiveResult ObjectiveFunction::evaluate(const EvidenceGraph& graph,
                                            double threshold) const {
    ObjectiveResult result;
    result.objective_name = name_;

    for (const auto& comp : components_) {
        double s = comp->score(graph);
        result.component_scores[comp->name()] = s;
        result.total_score += s * weight(comp->name());

        if (s < threshold) {
            OptimizationRecommendation rec;
            rec.target_node = kGlobalTarget;
            rec.action = OptimizationAction::ADJUST_CONFIDENCE;
            rec.adjustment = 0.1;
            rec.reasoning = fmt::format("Improve {} score from {:.2f}", comp->name(), s);
            result.recommendations.push_back(std::move(rec));
        }
    }
    return result;
}

// ─── Recommendations ───────────────────────────────────────────

bool applyRecommendation(EvidenceGraph& graph, const OptimizationRecommendation& rec) {
    switch (rec.action) {
        case OptimizationAction::ADJUST_CONFIDENCE: {
            auto adjust = [&](EvidenceNode& n) {
                n.posterior_probability =
                    std::clamp(n.posterior_probability + rec.adjustment, 0.0, 1.0);
            };
            if (rec.target_node == kGlobalTarget) {
                graph.updateEachNode(adjust);
                return graph.nodeCount() > 0;
            }
            EvidenceNode* node = graph.getNode(rec.target_node);
            if (!node) {
                spdlog::debug("Recommendation target {} not in graph, skipped", rec.target_node);
                return false;
            }
            adjust(*node);
            return true;
        }
        case OptimizationAction::ADD_EDGE:
        case OptimizationAction::REMOVE_EDGE:
        case OptimizationAction::UPDATE_WEIGHT:
            // Structural changes are reported, not applied.
            spdlog::debug("Recommendation {} for {} not applied: {}",
                          toString(rec.action), rec.target_node, rec.reasoning);
            return false;
    }
    return false;
}

} // namespace hegel
