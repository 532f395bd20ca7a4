#pragma once

#include "fuzzy/fuzzy_evidence.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace hegel {

/// One raw evidence record as produced upstream (file parsers, graph store
/// queries, reasoning services). confidence is expected in [0,1].
struct Evidence {
    std::string id;
    std::string molecule_id;
    std::string source;            // e.g. a specific experiment or database
    std::string evidence_type;     // "genomics", "mass_spec", "literature", ...
    double confidence = 0.0;
    std::string data;              // opaque payload, carried but not read
    std::unordered_map<std::string, std::string> metadata;
    std::optional<Clock::time_point> timestamp;   // now when absent
};

/// Evidence the caller expects for the entity but has not collected.
/// It enters the graph without data and is a prediction target.
struct ExpectedEvidence {
    std::string id;
    std::string evidence_type;
};

} // namespace hegel
