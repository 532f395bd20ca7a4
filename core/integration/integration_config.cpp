#include "integration/integration_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace hegel {

double IntegrationConfig::getEnvDouble(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        size_t pos = 0;
        double parsed = std::stod(val, &pos);
        if (pos != std::strlen(val)) throw std::invalid_argument(name);
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

size_t IntegrationConfig::getEnvSize(const char* name, size_t default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        size_t pos = 0;
        long long parsed = std::stoll(val, &pos);
        if (pos != std::strlen(val)) throw std::invalid_argument(name);
        if (parsed < 0) throw std::out_of_range(name);
        return static_cast<size_t>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("Invalid count for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool IntegrationConfig::getEnvBool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string s(val);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    spdlog::warn("Invalid flag for {}, using default {}", name, default_val);
    return default_val;
}

IntegrationConfig IntegrationConfig::fromEnv() {
    IntegrationConfig cfg;
    cfg.confidence_threshold =
        getEnvDouble("HEGEL_CONFIDENCE_THRESHOLD", cfg.confidence_threshold);
    cfg.prediction_threshold =
        getEnvDouble("HEGEL_PREDICTION_THRESHOLD", cfg.prediction_threshold);
    cfg.max_prediction_iterations =
        getEnvSize("HEGEL_MAX_PREDICTION_ITERATIONS", cfg.max_prediction_iterations);
    cfg.enable_temporal_decay =
        getEnvBool("HEGEL_ENABLE_TEMPORAL_DECAY", cfg.enable_temporal_decay);
    cfg.enable_network_learning =
        getEnvBool("HEGEL_ENABLE_NETWORK_LEARNING", cfg.enable_network_learning);
    cfg.inference.apply_rule_adjustments =
        getEnvBool("HEGEL_APPLY_RULE_ADJUSTMENTS", cfg.inference.apply_rule_adjustments);
    return cfg;
}

void IntegrationConfig::validate() const {
    auto inUnit = [](double v) { return v >= 0.0 && v <= 1.0; };
    if (!inUnit(confidence_threshold)) {
        throw std::invalid_argument("confidence_threshold must be in [0,1]");
    }
    if (!inUnit(prediction_threshold)) {
        throw std::invalid_argument("prediction_threshold must be in [0,1]");
    }
    if (!inUnit(inference.optimization_threshold)) {
        throw std::invalid_argument("optimization_threshold must be in [0,1]");
    }
    if (max_prediction_iterations == 0) {
        throw std::invalid_argument("max_prediction_iterations must be positive");
    }
}

} // namespace hegel
