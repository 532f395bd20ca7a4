// PyBind11 bindings for the hegel fusion core.
// Exposes fuzzy variables, evidence records, the integrator and its
// results to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DHEGEL_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

#include "fuzzy/membership.hpp"
#include "fuzzy/linguistic_variable.hpp"
#include "fuzzy/fuzzy_evidence.hpp"
#include "fuzzy/fuzzy_rule.hpp"
#include "network/evidence_graph.hpp"
#include "inference/fuzzy_bayesian_network.hpp"
#include "integration/evidence.hpp"
#include "integration/integration_config.hpp"
#include "integration/fuzzy_integrator.hpp"

namespace py = pybind11;

PYBIND11_MODULE(hegel_bindings, m) {
    m.doc() = "hegel fuzzy-Bayesian evidence fusion bindings";

    // ── MembershipFunction ──
    py::class_<hegel::MembershipFunction>(m, "MembershipFunction")
        .def_static("triangular", &hegel::MembershipFunction::triangular,
                    py::arg("low"), py::arg("peak"), py::arg("high"))
        .def_static("trapezoidal", &hegel::MembershipFunction::trapezoidal,
                    py::arg("low"), py::arg("low_peak"), py::arg("high_peak"), py::arg("high"))
        .def_static("gaussian", &hegel::MembershipFunction::gaussian,
                    py::arg("center"), py::arg("sigma"))
        .def_static("sigmoid", &hegel::MembershipFunction::sigmoid,
                    py::arg("center"), py::arg("slope"))
        .def("membership", &hegel::MembershipFunction::membership)
        .def("__repr__", &hegel::MembershipFunction::describe);

    // ── LinguisticVariable ──
    py::class_<hegel::LinguisticVariable>(m, "LinguisticVariable")
        .def(py::init<std::string, double, double>(),
             py::arg("name"), py::arg("universe_min"), py::arg("universe_max"))
        .def("add_term", &hegel::LinguisticVariable::addTerm)
        .def("fuzzify", &hegel::LinguisticVariable::fuzzify)
        .def("membership", &hegel::LinguisticVariable::membership)
        .def("has_term", &hegel::LinguisticVariable::hasTerm)
        .def_property_readonly("name", &hegel::LinguisticVariable::name)
        .def_property_readonly("term_count", &hegel::LinguisticVariable::termCount)
        .def_static("evidence_confidence", &hegel::LinguisticVariable::evidenceConfidence)
        .def_static("evidence_agreement", &hegel::LinguisticVariable::evidenceAgreement);

    // ── FuzzyEvidence ──
    py::class_<hegel::FuzzyEvidence>(m, "FuzzyEvidence")
        .def_static("from_raw_evidence",
                    [](std::string id, std::string source, std::string type, double raw_value,
                       hegel::Clock::time_point timestamp) {
                        return hegel::FuzzyEvidence::fromRawEvidence(
                            std::move(id), std::move(source), std::move(type),
                            raw_value, timestamp);
                    },
                    py::arg("id"), py::arg("source"), py::arg("evidence_type"),
                    py::arg("raw_value"), py::arg("timestamp"))
        .def_readonly("id", &hegel::FuzzyEvidence::id)
        .def_readonly("source", &hegel::FuzzyEvidence::source)
        .def_readonly("evidence_type", &hegel::FuzzyEvidence::evidence_type)
        .def_readonly("raw_value", &hegel::FuzzyEvidence::raw_value)
        .def_readonly("confidence_memberships", &hegel::FuzzyEvidence::confidence_memberships)
        .def_readonly("agreement_memberships", &hegel::FuzzyEvidence::agreement_memberships)
        .def_readonly("temporal_decay", &hegel::FuzzyEvidence::temporal_decay)
        .def_readonly("uncertainty_bounds", &hegel::FuzzyEvidence::uncertainty_bounds)
        .def("defuzzified_confidence", &hegel::FuzzyEvidence::defuzzifiedConfidence);

    // ── EvidenceRelationship ──
    py::enum_<hegel::EvidenceRelationship>(m, "EvidenceRelationship")
        .value("SUPPORTS", hegel::EvidenceRelationship::SUPPORTS)
        .value("CONTRADICTS", hegel::EvidenceRelationship::CONTRADICTS)
        .value("CORROBORATES", hegel::EvidenceRelationship::CORROBORATES)
        .value("IMPLIES", hegel::EvidenceRelationship::IMPLIES)
        .value("REQUIRES", hegel::EvidenceRelationship::REQUIRES);

    // ── EvidenceNode / EvidenceEdge ──
    py::class_<hegel::EvidenceNode>(m, "EvidenceNode")
        .def_readonly("id", &hegel::EvidenceNode::id)
        .def_readonly("evidence_type", &hegel::EvidenceNode::evidence_type)
        .def_readonly("fuzzy_evidence", &hegel::EvidenceNode::fuzzy_evidence)
        .def_readonly("prior_probability", &hegel::EvidenceNode::prior_probability)
        .def_readonly("posterior_probability", &hegel::EvidenceNode::posterior_probability)
        .def_readonly("network_influence", &hegel::EvidenceNode::network_influence)
        .def_readonly("rule_activations", &hegel::EvidenceNode::rule_activations);

    py::class_<hegel::EvidenceEdge>(m, "EvidenceEdge")
        .def_readonly("from_node", &hegel::EvidenceEdge::from)
        .def_readonly("to_node", &hegel::EvidenceEdge::to)
        .def_readonly("relationship", &hegel::EvidenceEdge::relationship)
        .def_readonly("strength", &hegel::EvidenceEdge::strength)
        .def_readonly("fuzzy_strength", &hegel::EvidenceEdge::fuzzy_strength);

    // ── Evidence records ──
    py::class_<hegel::Evidence>(m, "Evidence")
        .def(py::init<>())
        .def_readwrite("id", &hegel::Evidence::id)
        .def_readwrite("molecule_id", &hegel::Evidence::molecule_id)
        .def_readwrite("source", &hegel::Evidence::source)
        .def_readwrite("evidence_type", &hegel::Evidence::evidence_type)
        .def_readwrite("confidence", &hegel::Evidence::confidence)
        .def_readwrite("data", &hegel::Evidence::data)
        .def_readwrite("metadata", &hegel::Evidence::metadata)
        .def_readwrite("timestamp", &hegel::Evidence::timestamp);

    py::class_<hegel::ExpectedEvidence>(m, "ExpectedEvidence")
        .def(py::init<>())
        .def(py::init<std::string, std::string>(), py::arg("id"), py::arg("evidence_type"))
        .def_readwrite("id", &hegel::ExpectedEvidence::id)
        .def_readwrite("evidence_type", &hegel::ExpectedEvidence::evidence_type);

    // ── Configuration ──
    py::class_<hegel::InferenceConfig>(m, "InferenceConfig")
        .def(py::init<>())
        .def_readwrite("apply_rule_adjustments", &hegel::InferenceConfig::apply_rule_adjustments)
        .def_readwrite("optimization_threshold", &hegel::InferenceConfig::optimization_threshold);

    py::class_<hegel::IntegrationConfig>(m, "IntegrationConfig")
        .def(py::init<>())
        .def_readwrite("confidence_threshold", &hegel::IntegrationConfig::confidence_threshold)
        .def_readwrite("prediction_threshold", &hegel::IntegrationConfig::prediction_threshold)
        .def_readwrite("max_prediction_iterations",
                       &hegel::IntegrationConfig::max_prediction_iterations)
        .def_readwrite("enable_temporal_decay", &hegel::IntegrationConfig::enable_temporal_decay)
        .def_readwrite("enable_network_learning",
                       &hegel::IntegrationConfig::enable_network_learning)
        .def_readwrite("inference", &hegel::IntegrationConfig::inference)
        .def_static("from_env", &hegel::IntegrationConfig::fromEnv)
        .def("validate", &hegel::IntegrationConfig::validate);

    // ── Results ──
    py::class_<hegel::EvidencePrediction>(m, "EvidencePrediction")
        .def_readonly("node_id", &hegel::EvidencePrediction::node_id)
        .def_readonly("predicted_value", &hegel::EvidencePrediction::predicted_value)
        .def_readonly("confidence", &hegel::EvidencePrediction::confidence)
        .def_readonly("supporting_evidence", &hegel::EvidencePrediction::supporting_evidence)
        .def_readonly("reasoning", &hegel::EvidencePrediction::reasoning);

    py::class_<hegel::EnhancedConfidence>(m, "EnhancedConfidence")
        .def_readonly("original_confidence", &hegel::EnhancedConfidence::original_confidence)
        .def_readonly("fuzzy_confidence", &hegel::EnhancedConfidence::fuzzy_confidence)
        .def_readonly("bayesian_posterior", &hegel::EnhancedConfidence::bayesian_posterior)
        .def_readonly("network_influence", &hegel::EnhancedConfidence::network_influence)
        .def_readonly("final_confidence", &hegel::EnhancedConfidence::final_confidence)
        .def_readonly("uncertainty_bounds", &hegel::EnhancedConfidence::uncertainty_bounds)
        .def_readonly("meets_threshold", &hegel::EnhancedConfidence::meets_threshold);

    py::class_<hegel::FuzzyIntegrationResult>(m, "FuzzyIntegrationResult")
        .def_readonly("original_evidence_count",
                      &hegel::FuzzyIntegrationResult::original_evidence_count)
        .def_readonly("integrated_evidence_count",
                      &hegel::FuzzyIntegrationResult::integrated_evidence_count)
        .def_readonly("predictions", &hegel::FuzzyIntegrationResult::predictions)
        .def_readonly("enhanced_confidences",
                      &hegel::FuzzyIntegrationResult::enhanced_confidences)
        .def_readonly("integration_errors", &hegel::FuzzyIntegrationResult::integration_errors)
        .def_readonly("network_coherence_score",
                      &hegel::FuzzyIntegrationResult::network_coherence_score);

    py::class_<hegel::NetworkStatistics>(m, "NetworkStatistics")
        .def_readonly("node_count", &hegel::NetworkStatistics::node_count)
        .def_readonly("edge_count", &hegel::NetworkStatistics::edge_count)
        .def_readonly("avg_confidence", &hegel::NetworkStatistics::avg_confidence)
        .def_readonly("conflict_count", &hegel::NetworkStatistics::conflict_count)
        .def_readonly("coherence_score", &hegel::NetworkStatistics::coherence_score);

    // ── Integrator ──
    py::class_<hegel::FuzzyEvidenceIntegrator>(m, "FuzzyEvidenceIntegrator")
        .def(py::init<hegel::IntegrationConfig>(),
             py::arg("config") = hegel::IntegrationConfig{})
        .def("integrate_evidence", &hegel::FuzzyEvidenceIntegrator::integrateEvidence,
             py::arg("evidence"),
             py::arg("expected") = std::vector<hegel::ExpectedEvidence>{})
        .def("network_statistics", &hegel::FuzzyEvidenceIntegrator::networkStatistics)
        .def("network_coherence", &hegel::FuzzyEvidenceIntegrator::networkCoherence)
        .def("nodes", [](const hegel::FuzzyEvidenceIntegrator& self) {
            std::vector<hegel::EvidenceNode> nodes;
            self.network().graph().forEachNode(
                [&](const hegel::EvidenceNode& n) { nodes.push_back(n); });
            return nodes;
        })
        .def("edges", [](const hegel::FuzzyEvidenceIntegrator& self) {
            return self.network().graph().edges();
        });

    py::register_exception<hegel::EvidenceConversionError>(m, "EvidenceConversionError");
}
