#include "fuzzy/fuzzy_rule.hpp"
#include <algorithm>

namespace hegel {

std::string toString(FuzzyOperator op) {
    switch (op) {
        case FuzzyOperator::IS:           return "is";
        case FuzzyOperator::IS_NOT:       return "is_not";
        case FuzzyOperator::GREATER_THAN: return "greater_than";
        case FuzzyOperator::LESS_THAN:    return "less_than";
    }
    return "unknown";
}

MembershipMap membershipsFor(const FuzzyEvidence& evidence,
                             const std::string& variable,
                             const VariableRegistry& variables) {
    if (variable == "confidence") return evidence.confidence_memberships;
    if (variable == "agreement") return evidence.agreement_memberships;

    const LinguisticVariable* var = variables.find(variable);
    auto factor = evidence.contextual_factors.find(variable);
    if (!var || factor == evidence.contextual_factors.end()) return {};
    return var->fuzzify(factor->second);
}

double evaluateCondition(const FuzzyCondition& condition,
                         const FuzzyEvidence& evidence,
                         const VariableRegistry& variables) {
    const LinguisticVariable* var = variables.find(condition.variable);
    if (!var) return 0.0;
    int index = var->termIndex(condition.term);
    if (index < 0) return 0.0;

    MembershipMap degrees = membershipsFor(evidence, condition.variable, variables);
    auto degreeOf = [&](const std::string& term) {
        auto it = degrees.find(term);
        return it != degrees.end() ? it->second : 0.0;
    };

    const auto& terms = var->terms();
    switch (condition.op) {
        case FuzzyOperator::IS:
            return degreeOf(condition.term);
        case FuzzyOperator::IS_NOT:
            return 1.0 - degreeOf(condition.term);
        case FuzzyOperator::GREATER_THAN: {
            double best = 0.0;
            for (size_t i = static_cast<size_t>(index) + 1; i < terms.size(); i++) {
                best = std::max(best, degreeOf(terms[i].first));
            }
            return best;
        }
        case FuzzyOperator::LESS_THAN: {
            double best = 0.0;
            for (size_t i = 0; i < static_cast<size_t>(index); i++) {
                best = std::max(best, degreeOf(terms[i].first));
            }
            return best;
        }
    }
    return 0.0;
}

double ruleActivation(const FuzzyRule& rule,
                      const FuzzyEvidence& evidence,
                      const VariableRegistry& variables) {
    double activation = 1.0;
    for (const auto& condition : rule.antecedent) {
        activation = std::min(activation, evaluateCondition(condition, evidence, variables));
    }
    return activation * rule.weight;
}

std::vector<FuzzyRule> defaultFuzzyRules() {
    FuzzyRule support;
    support.id = "high_confidence_support";
    support.antecedent = {{"confidence", "high", FuzzyOperator::IS}};
    support.consequent = {"posterior", "increase", 0.1};
    support.weight = 1.0;

    FuzzyRule penalty;
    penalty.id = "conflicting_evidence_penalty";
    penalty.antecedent = {{"agreement", "conflicting", FuzzyOperator::IS}};
    penalty.consequent = {"posterior", "decrease", -0.2};
    penalty.weight = 1.0;

    return {support, penalty};
}

} // namespace hegel
