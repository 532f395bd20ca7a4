#include "fuzzy/linguistic_variable.hpp"

namespace hegel {

LinguisticVariable::LinguisticVariable(std::string name, double universe_min,
                                       double universe_max)
    : name_(std::move(name)), min_(universe_min), max_(universe_max) {}

void LinguisticVariable::addTerm(const std::string& term, const MembershipFunction& fn) {
    for (auto& existing : terms_) {
        if (existing.first == term) {
            existing.second = fn;
            return;
        }
    }
    terms_.emplace_back(term, fn);
}

MembershipMap LinguisticVariable::fuzzify(double value) const {
    MembershipMap degrees;
    degrees.reserve(terms_.size());
    for (const auto& [term, fn] : terms_) {
        degrees[term] = fn.membership(value);
    }
    return degrees;
}

double LinguisticVariable::membership(const std::string& term, double value) const {
    for (const auto& [name, fn] : terms_) {
        if (name == term) return fn.membership(value);
    }
    return 0.0;
}

bool LinguisticVariable::hasTerm(const std::string& term) const {
    return termIndex(term) >= 0;
}

int LinguisticVariable::termIndex(const std::string& term) const {
    for (size_t i = 0; i < terms_.size(); i++) {
        if (terms_[i].first == term) return static_cast<int>(i);
    }
    return -1;
}

// ─── Built-ins ─────────────────────────────────────────────────

LinguisticVariable LinguisticVariable::evidenceConfidence() {
    LinguisticVariable v("evidence_confidence", 0.0, 1.0);
    v.addTerm("very_low",  MembershipFunction::triangular(0.0, 0.0, 0.2));
    v.addTerm("low",       MembershipFunction::triangular(0.0, 0.2, 0.4));
    v.addTerm("medium",    MembershipFunction::triangular(0.2, 0.5, 0.8));
    v.addTerm("high",      MembershipFunction::triangular(0.6, 0.8, 1.0));
    v.addTerm("very_high", MembershipFunction::triangular(0.8, 1.0, 1.0));
    return v;
}

LinguisticVariable LinguisticVariable::evidenceAgreement() {
    LinguisticVariable v("evidence_agreement", 0.0, 1.0);
    v.addTerm("conflicting", MembershipFunction::trapezoidal(0.0, 0.0, 0.3, 0.5));
    v.addTerm("neutral",     MembershipFunction::triangular(0.3, 0.5, 0.7));
    v.addTerm("supporting",  MembershipFunction::trapezoidal(0.5, 0.7, 1.0, 1.0));
    return v;
}

// ─── Registry ──────────────────────────────────────────────────

VariableRegistry VariableRegistry::withDefaults() {
    VariableRegistry registry;
    registry.add("confidence", LinguisticVariable::evidenceConfidence());
    registry.add("agreement", LinguisticVariable::evidenceAgreement());
    return registry;
}

void VariableRegistry::add(const std::string& key, LinguisticVariable variable) {
    variables_[key] = std::move(variable);
}

const LinguisticVariable* VariableRegistry::find(const std::string& key) const {
    auto it = variables_.find(key);
    return it != variables_.end() ? &it->second : nullptr;
}

} // namespace hegel
