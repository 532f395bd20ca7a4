#pragma once

#include "inference/fuzzy_bayesian_network.hpp"
#include "integration/evidence.hpp"
#include "integration/integration_config.hpp"

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hegel {

/// A single evidence record could not be turned into fuzzy evidence.
class EvidenceConversionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Confidence of one evidence item as seen by each stage of the fusion.
struct EnhancedConfidence {
    double original_confidence = 0.0;
    double fuzzy_confidence = 0.0;
    double bayesian_posterior = 0.0;
    double network_influence = 0.0;
    double final_confidence = 0.0;      // 0.4 fuzzy + 0.4 posterior + 0.2 |influence|
    std::pair<double, double> uncertainty_bounds{0.0, 0.0};
    bool meets_threshold = false;       // final >= confidence_threshold
};

struct FuzzyIntegrationResult {
    size_t original_evidence_count = 0;
    size_t integrated_evidence_count = 0;   // nodes in the graph
    std::vector<EvidencePrediction> predictions;
    std::unordered_map<std::string, EnhancedConfidence> enhanced_confidences;
    std::vector<std::string> integration_errors;
    double network_coherence_score = 0.0;
};

struct NetworkStatistics {
    size_t node_count = 0;
    size_t edge_count = 0;
    double avg_confidence = 0.0;
    size_t conflict_count = 0;
    double coherence_score = 0.0;
};

// ─── Fuzzy Evidence Integrator ─────────────────────────────────
// Turns a batch of raw evidence records into an evidence graph, runs one
// inference cycle over it and reads back per-item confidences, a
// coherence score and predictions for expected-but-missing evidence.
//
// Each call starts from an empty graph. The call is synchronous and
// O(n²) in the batch size; one integrator per concurrent fusion.

class FuzzyEvidenceIntegrator {
public:
    explicit FuzzyEvidenceIntegrator(IntegrationConfig config = {});

    /// Fuse a batch. Never throws for bad records: they are reported in
    /// integration_errors and the rest of the batch proceeds.
    FuzzyIntegrationResult integrateEvidence(const std::vector<Evidence>& evidence,
                                             const std::vector<ExpectedEvidence>& expected = {});

    /// Throws EvidenceConversionError for an empty id or a confidence that
    /// is non-finite or outside [0,1].
    FuzzyEvidence convertToFuzzyEvidence(const Evidence& evidence) const;

    /// Statistics of the graph left by the last integrateEvidence call.
    NetworkStatistics networkStatistics() const;

    /// 0.6 · mean confidence + 0.4 · mean strength-weighted edge consistency;
    /// 0 for an empty graph.
    double networkCoherence() const;

    const FuzzyBayesianNetwork& network() const { return network_; }
    FuzzyBayesianNetwork& network() { return network_; }
    const IntegrationConfig& config() const { return config_; }

private:
    IntegrationConfig config_;
    FuzzyBayesianNetwork network_;

    void buildRelationships(const std::vector<const Evidence*>& observed,
                            const std::vector<ExpectedEvidence>& expected);
    void assignAgreement(const std::vector<const Evidence*>& observed);
    std::vector<EvidencePrediction> generatePredictions(
        const std::vector<Evidence>& evidence) const;
    EnhancedConfidence enhancedConfidence(const Evidence& evidence,
                                          const EvidenceNode& node) const;
};

} // namespace hegel
