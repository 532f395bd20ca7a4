#pragma once

#include "fuzzy/linguistic_variable.hpp"
#include <chrono>
#include <string>
#include <utility>

namespace hegel {

using Clock = std::chrono::system_clock;

// ─── Calibration ───────────────────────────────────────────────
// Empirically chosen constants. Recalibrate here, not in control flow.

namespace calibration {

/// e-folding time of temporal decay, in hours (~30 days).
constexpr double kDecayHorizonHours = 24.0 * 30.0;

/// Half-width of the uncertainty interval, as a fraction of the value.
constexpr double kMassSpecBand   = 0.05;
constexpr double kGenomicsBand   = 0.10;
constexpr double kLiteratureBand = 0.15;
constexpr double kDefaultBand    = 0.10;

/// Representative value of each confidence term, used by defuzzification.
constexpr double kVeryLowValue  = 0.10;
constexpr double kLowValue      = 0.30;
constexpr double kMediumValue   = 0.50;
constexpr double kHighValue     = 0.80;
constexpr double kVeryHighValue = 0.95;

/// Fallback when no term is active or the term is unknown.
constexpr double kNeutralConfidence = 0.5;

double uncertaintyBand(const std::string& evidence_type);
double termRepresentativeValue(const std::string& term);

} // namespace calibration

// ─── Fuzzy Evidence ────────────────────────────────────────────
// One observation with fuzzified confidence, temporal decay, and an
// uncertainty interval. Built only through fromRawEvidence().

struct FuzzyEvidence {
    std::string id;
    std::string source;
    std::string evidence_type;
    double raw_value = 0.0;
    MembershipMap confidence_memberships;
    MembershipMap agreement_memberships;   // filled during integration
    std::unordered_map<std::string, double> contextual_factors;
    double temporal_decay = 1.0;           // in (0,1]
    std::pair<double, double> uncertainty_bounds{0.0, 0.0};

    static FuzzyEvidence fromRawEvidence(std::string id,
                                         std::string source,
                                         std::string evidence_type,
                                         double raw_value,
                                         Clock::time_point timestamp,
                                         Clock::time_point now = Clock::now());

    /// Decay-weighted centroid over the confidence terms.
    /// Decay scales the numerator only, so a stale item is pulled toward
    /// zero without shrinking the normalisation weights.
    double defuzzifiedConfidence() const;

    /// Fuzzify an agreement level into agreement_memberships.
    void setAgreement(double agreement_level, const LinguisticVariable& agreement);

    double uncertaintyWidth() const {
        return uncertainty_bounds.second - uncertainty_bounds.first;
    }

private:
    FuzzyEvidence() = default;
};

} // namespace hegel
