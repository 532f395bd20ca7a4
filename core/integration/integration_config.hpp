#pragma once

#include "inference/fuzzy_bayesian_network.hpp"
#include <cstddef>
#include <string>

namespace hegel {

struct IntegrationConfig {
    double confidence_threshold = 0.5;      // final confidence that counts as accepted
    double prediction_threshold = 0.7;      // minimum confidence of a reported prediction
    size_t max_prediction_iterations = 10;  // reserved for iterative refinement
    bool enable_temporal_decay = true;
    bool enable_network_learning = true;    // gates prediction entirely
    InferenceConfig inference;

    /// Defaults overridden by HEGEL_* environment variables:
    ///   HEGEL_CONFIDENCE_THRESHOLD, HEGEL_PREDICTION_THRESHOLD,
    ///   HEGEL_MAX_PREDICTION_ITERATIONS, HEGEL_ENABLE_TEMPORAL_DECAY,
    ///   HEGEL_ENABLE_NETWORK_LEARNING, HEGEL_APPLY_RULE_ADJUSTMENTS.
    /// Unparsable values are logged and ignored.
    static IntegrationConfig fromEnv();

    /// Throws std::invalid_argument on an out-of-range setting.
    void validate() const;

private:
    static double getEnvDouble(const char* name, double default_val);
    static size_t getEnvSize(const char* name, size_t default_val);
    static bool getEnvBool(const char* name, bool default_val);
};

} // namespace hegel
