#pragma once

#include "fuzzy/membership.hpp"
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hegel {

/// Term name → membership degree.
using MembershipMap = std::unordered_map<std::string, double>;

// ─── Linguistic Variable ───────────────────────────────────────
// A named fuzzy variable over a bounded universe. Terms are kept in
// ordinal order (lowest first); GreaterThan/LessThan conditions rely on it.

class LinguisticVariable {
public:
    using Term = std::pair<std::string, MembershipFunction>;

    LinguisticVariable() = default;
    LinguisticVariable(std::string name, double universe_min, double universe_max);

    /// Append a term. Re-adding an existing term replaces its shape in place.
    void addTerm(const std::string& term, const MembershipFunction& fn);

    /// Degrees for every term. No term is omitted, even at degree 0.
    MembershipMap fuzzify(double value) const;

    /// Degree of a single term; 0 for an unknown term.
    double membership(const std::string& term, double value) const;

    bool hasTerm(const std::string& term) const;

    /// Ordinal position of a term, or -1 when unknown.
    int termIndex(const std::string& term) const;

    const std::string& name() const { return name_; }
    std::pair<double, double> universe() const { return {min_, max_}; }
    const std::vector<Term>& terms() const { return terms_; }
    size_t termCount() const { return terms_.size(); }

    // ── Built-in variables ──
    static LinguisticVariable evidenceConfidence();
    static LinguisticVariable evidenceAgreement();

private:
    std::string name_;
    double min_ = 0.0;
    double max_ = 1.0;
    std::vector<Term> terms_;
};

// ─── Variable Registry ─────────────────────────────────────────
// Variables by name. Owned by whoever runs inference and passed by
// reference to the code that evaluates rule conditions.

class VariableRegistry {
public:
    VariableRegistry() = default;

    /// Registry holding "confidence" and "agreement".
    static VariableRegistry withDefaults();

    void add(const std::string& key, LinguisticVariable variable);
    const LinguisticVariable* find(const std::string& key) const;
    bool contains(const std::string& key) const { return variables_.count(key) > 0; }
    size_t size() const { return variables_.size(); }

private:
    std::unordered_map<std::string, LinguisticVariable> variables_;
};

} // namespace hegel
