#pragma once

#include "network/evidence_graph.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace hegel {

enum class ObjectiveKind {
    MAXIMIZE_CONFIDENCE,
    MINIMIZE_UNCERTAINTY,
    MAXIMIZE_CONSISTENCY,
    MINIMIZE_CONFLICTS,
    MAXIMIZE_NETWORK_COHERENCE
};

std::string toString(ObjectiveKind kind);

enum class OptimizationAction {
    ADJUST_CONFIDENCE,
    ADD_EDGE,
    REMOVE_EDGE,
    UPDATE_WEIGHT
};

std::string toString(OptimizationAction action);

/// Target that addresses every node of the graph.
inline const std::string kGlobalTarget = "global";

struct OptimizationRecommendation {
    std::string target_node;
    OptimizationAction action = OptimizationAction::ADJUST_CONFIDENCE;
    double adjustment = 0.0;
    std::string reasoning;
};

struct ObjectiveResult {
    std::string objective_name;
    double total_score = 0.0;      // weighted sum of component scores
    std::unordered_map<std::string, double> component_scores;
    std::vector<OptimizationRecommendation> recommendations;
};

// ─── Objective Component ───────────────────────────────────────
// One scoring criterion over the whole graph. Scores are oriented so that
// higher is better and fall in [0,1]; an empty graph scores neutral.

class ObjectiveComponent {
public:
    explicit ObjectiveComponent(std::string name) : name_(std::move(name)) {}
    virtual ~ObjectiveComponent() = default;

    virtual double score(const EvidenceGraph& graph) const = 0;
    virtual ObjectiveKind kind() const = 0;

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/// Build the component that implements kind, under the given name.
std::unique_ptr<ObjectiveComponent> makeObjectiveComponent(ObjectiveKind kind,
                                                           const std::string& name);

// ─── Objective Function ────────────────────────────────────────
// Weighted combination of components. Components without an explicit
// weight count with weight 1.

class ObjectiveFunction {
public:
    explicit ObjectiveFunction(std::string name) : name_(std::move(name)) {}

    void addComponent(std::unique_ptr<ObjectiveComponent> component, double weight);
    void addComponent(std::unique_ptr<ObjectiveComponent> component);
    void setWeight(const std::string& component, double weight) { weights_[component] = weight; }
    double weight(const std::string& component) const;

    /// Score every component and recommend a confidence adjustment for
    /// each one below the threshold.
    ObjectiveResult evaluate(const EvidenceGraph& graph, double threshold = 0.5) const;

    const std::string& name() const { return name_; }
    size_t componentCount() const { return components_.size(); }
    const std::vector<std::unique_ptr<ObjectiveComponent>>& components() const {
        return components_;
    }

private:
    std::string name_;
    std::vector<std::unique_ptr<ObjectiveComponent>> components_;
    std::unordered_map<std::string, double> weights_;
};

/// Apply a recommendation to the graph. Confidence adjustments move the
/// posterior of the target (or of every node for the global target),
/// clamped to [0,1]. Returns false when nothing was changed.
bool applyRecommendation(EvidenceGraph& graph, const OptimizationRecommendation& rec);

} // namespace hegel
