#include "fuzzy/fuzzy_evidence.hpp"
#include <algorithm>
#include <cmath>

namespace hegel {

namespace calibration {

double uncertaintyBand(const std::string& evidence_type) {
    if (evidence_type == "mass_spec")  return kMassSpecBand;
    if (evidence_type == "genomics")   return kGenomicsBand;
    if (evidence_type == "literature") return kLiteratureBand;
    return kDefaultBand;
}

double termRepresentativeValue(const std::string& term) {
    if (term == "very_low")  return kVeryLowValue;
    if (term == "low")       return kLowValue;
    if (term == "medium")    return kMediumValue;
    if (term == "high")      return kHighValue;
    if (term == "very_high") return kVeryHighValue;
    return kNeutralConfidence;
}

} // namespace calibration

FuzzyEvidence FuzzyEvidence::fromRawEvidence(std::string id,
                                             std::string source,
                                             std::string evidence_type,
                                             double raw_value,
                                             Clock::time_point timestamp,
                                             Clock::time_point now) {
    static const LinguisticVariable confidence = LinguisticVariable::evidenceConfidence();

    FuzzyEvidence ev;
    ev.id = std::move(id);
    ev.source = std::move(source);
    ev.evidence_type = std::move(evidence_type);
    ev.raw_value = raw_value;
    ev.confidence_memberships = confidence.fuzzify(raw_value);

    // Whole hours, as recorded upstream. Future timestamps count as fresh.
    auto age = std::chrono::duration_cast<std::chrono::hours>(now - timestamp).count();
    double age_hours = std::max(0.0, static_cast<double>(age));
    ev.temporal_decay = std::exp(-age_hours / calibration::kDecayHorizonHours);

    double band = calibration::uncertaintyBand(ev.evidence_type);
    ev.uncertainty_bounds = {raw_value * (1.0 - band), raw_value * (1.0 + band)};
    return ev;
}

double FuzzyEvidence::defuzzifiedConfidence() const {
    double numerator = 0.0;
    double denominator = 0.0;
    for (const auto& [term, degree] : confidence_memberships) {
        numerator += calibration::termRepresentativeValue(term) * degree * temporal_decay;
        denominator += degree;
    }
    if (denominator <= 0.0) return calibration::kNeutralConfidence;
    return numerator / denominator;
}

void FuzzyEvidence::setAgreement(double agreement_level, const LinguisticVariable& agreement) {
    agreement_memberships = agreement.fuzzify(agreement_level);
}

} // namespace hegel
