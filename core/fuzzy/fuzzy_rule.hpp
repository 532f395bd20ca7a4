#pragma once

#include "fuzzy/fuzzy_evidence.hpp"
#include "fuzzy/linguistic_variable.hpp"
#include <string>
#include <vector>

namespace hegel {

enum class FuzzyOperator {
    IS,
    IS_NOT,
    GREATER_THAN,   // any term ordered after the named one
    LESS_THAN       // any term ordered before the named one
};

std::string toString(FuzzyOperator op);

struct FuzzyCondition {
    std::string variable;
    std::string term;
    FuzzyOperator op = FuzzyOperator::IS;
};

struct FuzzyConsequent {
    std::string variable;
    std::string term;
    double adjustment = 0.0;    // signed
};

// ─── Fuzzy Rule ────────────────────────────────────────────────
// IF c1 AND c2 AND ... THEN consequent, with AND as the minimum t-norm.

struct FuzzyRule {
    std::string id;
    std::vector<FuzzyCondition> antecedent;
    FuzzyConsequent consequent;
    double weight = 1.0;
};

/// Memberships an evidence item holds for a variable:
/// "confidence" and "agreement" read the stored maps; any other registered
/// variable fuzzifies the contextual factor of the same name.
MembershipMap membershipsFor(const FuzzyEvidence& evidence,
                             const std::string& variable,
                             const VariableRegistry& variables);

/// Satisfaction of one condition for one evidence item, in [0,1].
/// Unknown variables and terms are unsatisfied.
double evaluateCondition(const FuzzyCondition& condition,
                         const FuzzyEvidence& evidence,
                         const VariableRegistry& variables);

/// min over the antecedent (1 when empty), scaled by the rule weight.
double ruleActivation(const FuzzyRule& rule,
                      const FuzzyEvidence& evidence,
                      const VariableRegistry& variables);

/// high_confidence_support and conflicting_evidence_penalty.
std::vector<FuzzyRule> defaultFuzzyRules();

} // namespace hegel
