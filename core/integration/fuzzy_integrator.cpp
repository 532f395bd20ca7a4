#include "integration/fuzzy_integrator.hpp"
#include "integration/relationship_inference.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace hegel {

FuzzyEvidenceIntegrator::FuzzyEvidenceIntegrator(IntegrationConfig config)
    : config_(config), network_(config.inference) {
    config_.validate();
}

FuzzyEvidence FuzzyEvidenceIntegrator::convertToFuzzyEvidence(const Evidence& evidence) const {
    if (evidence.id.empty()) {
        throw EvidenceConversionError("evidence id is empty");
    }
    if (!std::isfinite(evidence.confidence)) {
        throw EvidenceConversionError("confidence is not a finite number");
    }
    if (evidence.confidence < 0.0 || evidence.confidence > 1.0) {
        throw EvidenceConversionError("confidence " + std::to_string(evidence.confidence) +
                                      " outside [0,1]");
    }

    auto now = Clock::now();
    auto timestamp = evidence.timestamp.value_or(now);
    FuzzyEvidence fuzzy = FuzzyEvidence::fromRawEvidence(
        evidence.id, evidence.source, evidence.evidence_type,
        evidence.confidence, timestamp, now);
    if (!config_.enable_temporal_decay) {
        fuzzy.temporal_decay = 1.0;
    }
    return fuzzy;
}

FuzzyIntegrationResult FuzzyEvidenceIntegrator::integrateEvidence(
    const std::vector<Evidence>& evidence,
    const std::vector<ExpectedEvidence>& expected) {

    spdlog::info("Integrating {} evidence items into fuzzy network", evidence.size());
    network_.reset();

    FuzzyIntegrationResult result;
    result.original_evidence_count = evidence.size();

    // ── 1. Convert and add ──
    std::vector<const Evidence*> observed;
    std::unordered_set<std::string> seen;
    for (const auto& ev : evidence) {
        if (!ev.id.empty() && seen.count(ev.id)) {
            spdlog::warn("Skipping duplicate evidence {}", ev.id);
            result.integration_errors.push_back("Evidence " + ev.id + ": duplicate id in batch");
            continue;
        }
        try {
            network_.addEvidence(convertToFuzzyEvidence(ev));
            seen.insert(ev.id);
            observed.push_back(&ev);
        } catch (const EvidenceConversionError& e) {
            spdlog::warn("Failed to convert evidence {}: {}", ev.id, e.what());
            result.integration_errors.push_back("Evidence " + ev.id + ": " + e.what());
        }
    }

    std::vector<ExpectedEvidence> placeholders;
    std::unordered_set<std::string> seen_expected;
    for (const auto& ex : expected) {
        if (ex.id.empty()) {
            result.integration_errors.push_back("Expected evidence: empty id");
            continue;
        }
        if (!seen_expected.insert(ex.id).second) {
            spdlog::warn("Skipping duplicate expected evidence {}", ex.id);
            result.integration_errors.push_back("Expected evidence " + ex.id +
                                                ": duplicate id in batch");
            continue;
        }
        if (network_.graph().hasNode(ex.id)) {
            spdlog::debug("Expected evidence {} already observed", ex.id);
            continue;
        }
        network_.addPlaceholder(ex.id, ex.evidence_type);
        placeholders.push_back(ex);
    }

    // ── 2. Relationships ──
    buildRelationships(observed, placeholders);
    assignAgreement(observed);

    // ── 3. Inference ──
    network_.updateNetwork();

    // ── 4. Predictions ──
    if (config_.enable_network_learning) {
        result.predictions = generatePredictions(evidence);
    }

    // ── 5. Enhanced confidences ──
    for (const Evidence* ev : observed) {
        const EvidenceNode* node = network_.graph().getNode(ev->id);
        if (!node) continue;
        result.enhanced_confidences.emplace(ev->id, enhancedConfidence(*ev, *node));
    }

    // ── 6. Coherence ──
    result.integrated_evidence_count = network_.graph().nodeCount();
    result.network_coherence_score = networkCoherence();
    return result;
}

void FuzzyEvidenceIntegrator::buildRelationships(
    const std::vector<const Evidence*>& observed,
    const std::vector<ExpectedEvidence>& expected) {

    spdlog::debug("Building evidence relationships for {} evidence items", observed.size());

    for (size_t i = 0; i < observed.size(); i++) {
        for (size_t j = i + 1; j < observed.size(); j++) {
            const Evidence& a = *observed[i];
            const Evidence& b = *observed[j];
            auto [relationship, strength] = inferRelationship(a, b);
            if (strength <= kEdgeNoiseFloor) continue;

            EvidenceEdge edge(a.id, b.id, relationship, strength);
            edge.fuzzy_strength = fuzzyRelationshipStrength(a, b);
            network_.addEdge(std::move(edge));
        }
    }

    for (const auto& ex : expected) {
        const EvidenceNode* node = network_.graph().getNode(ex.id);
        if (!node || node->hasEvidence()) continue;
        for (const Evidence* ev : observed) {
            auto link = expectedRelationship(*ev, ex);
            if (!link || link->second <= kEdgeNoiseFloor) continue;
            network_.addEdge(EvidenceEdge(ev->id, ex.id, link->first, link->second));
        }
    }

    spdlog::debug("Built {} evidence relationships", network_.graph().edgeCount());
}

void FuzzyEvidenceIntegrator::assignAgreement(const std::vector<const Evidence*>& observed) {
    const LinguisticVariable* agreement = network_.variables().find("agreement");
    if (!agreement) return;

    for (const Evidence* ev : observed) {
        double level = 0.5;
        if (observed.size() > 1) {
            double sum = 0.0;
            for (const Evidence* other : observed) {
                if (other == ev) continue;
                sum += 1.0 - std::abs(ev->confidence - other->confidence);
            }
            level = sum / static_cast<double>(observed.size() - 1);
        }
        EvidenceNode* node = network_.graph().getNode(ev->id);
        if (node && node->hasEvidence()) {
            node->fuzzy_evidence->setAgreement(level, *agreement);
        }
    }
}

std::vector<EvidencePrediction> FuzzyEvidenceIntegrator::generatePredictions(
    const std::vector<Evidence>& evidence) const {

    std::unordered_set<std::string> known;
    for (const auto& ev : evidence) known.insert(ev.id);

    std::vector<EvidencePrediction> predictions = network_.predictMissingEvidence(known);
    predictions.erase(
        std::remove_if(predictions.begin(), predictions.end(),
                       [&](const EvidencePrediction& p) {
                           return p.confidence < config_.prediction_threshold;
                       }),
        predictions.end());

    spdlog::info("Generated {} high-confidence evidence predictions", predictions.size());
    return predictions;
}

EnhancedConfidence FuzzyEvidenceIntegrator::enhancedConfidence(const Evidence& evidence,
                                                               const EvidenceNode& node) const {
    constexpr double kFuzzyWeight = 0.4;
    constexpr double kBayesianWeight = 0.4;
    constexpr double kNetworkWeight = 0.2;

    EnhancedConfidence ec;
    ec.original_confidence = evidence.confidence;
    ec.fuzzy_confidence = node.confidence(evidence.confidence);
    ec.bayesian_posterior = node.posterior_probability;
    ec.network_influence = node.network_influence;
    ec.uncertainty_bounds = node.hasEvidence()
        ? node.fuzzy_evidence->uncertainty_bounds
        : std::make_pair(evidence.confidence * 0.9, evidence.confidence * 1.1);

    double fuzzy = node.confidence(0.5);
    double combined = fuzzy * kFuzzyWeight +
                      node.posterior_probability * kBayesianWeight +
                      std::abs(node.network_influence) * kNetworkWeight;
    ec.final_confidence = std::clamp(combined, 0.0, 1.0);
    ec.meets_threshold = ec.final_confidence >= config_.confidence_threshold;
    return ec;
}

double FuzzyEvidenceIntegrator::networkCoherence() const {
    const EvidenceGraph& graph = network_.graph();
    if (graph.nodeCount() == 0) return 0.0;

    double confidence_sum = 0.0;
    size_t evidence_count = 0;
    graph.forEachNode([&](const EvidenceNode& n) {
        if (!n.hasEvidence()) return;
        confidence_sum += n.fuzzy_evidence->defuzzifiedConfidence();
        evidence_count++;
    });
    double avg_confidence = evidence_count > 0
        ? confidence_sum / static_cast<double>(evidence_count) : 0.0;

    double consistency_sum = 0.0;
    size_t relationship_count = 0;
    graph.forEachEdge([&](const EvidenceEdge& e) {
        const EvidenceNode* from = graph.getNode(e.from);
        const EvidenceNode* to = graph.getNode(e.to);
        if (!from || !to) return;

        double diff = std::abs(from->posterior_probability - to->posterior_probability);
        double consistency = 0.5;
        switch (e.relationship) {
            case EvidenceRelationship::SUPPORTS:
            case EvidenceRelationship::CORROBORATES:
                consistency = 1.0 - diff;
                break;
            case EvidenceRelationship::CONTRADICTS:
                consistency = diff;
                break;
            case EvidenceRelationship::IMPLIES:
            case EvidenceRelationship::REQUIRES:
                consistency = 0.5;
                break;
        }
        consistency_sum += consistency * e.strength;
        relationship_count++;
    });
    double avg_consistency = relationship_count > 0
        ? consistency_sum / static_cast<double>(relationship_count) : 0.5;

    return std::clamp(avg_confidence * 0.6 + avg_consistency * 0.4, 0.0, 1.0);
}

NetworkStatistics FuzzyEvidenceIntegrator::networkStatistics() const {
    const EvidenceGraph& graph = network_.graph();
    NetworkStatistics stats;
    stats.node_count = graph.nodeCount();
    stats.edge_count = graph.edgeCount();

    double sum = 0.0;
    size_t count = 0;
    graph.forEachNode([&](const EvidenceNode& n) {
        if (!n.hasEvidence()) return;
        sum += n.fuzzy_evidence->defuzzifiedConfidence();
        count++;
    });
    stats.avg_confidence = count > 0 ? sum / static_cast<double>(count) : 0.0;
    stats.conflict_count = std::count_if(
        graph.edges().begin(), graph.edges().end(),
        [](const EvidenceEdge& e) { return e.relationship == EvidenceRelationship::CONTRADICTS; });
    stats.coherence_score = networkCoherence();
    return stats;
}

} // namespace hegel
