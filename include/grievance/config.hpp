#pragma once

#include "grievance/log.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace grievance {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct EngineConfig {
    // Fairness scoring
    double      consistency_threshold = 0.85;
    double      review_band_upper     = 0.90;   // scores below this get "review suggested"
    double      outcome_weight        = 0.5;
    double      rule_weight           = 0.3;
    double      tier_weight           = 0.2;
    std::size_t similar_case_limit    = 10;
    std::size_t preview_limit         = 5;

    LogLevel    log_level             = LogLevel::Info;

    /// Throws ConfigError describing the first invalid setting.
    void validate() const;
};

/**
 * Reads an EngineConfig from YAML. Every key is optional:
 *
 *   fairness:
 *     consistency_threshold: 0.85
 *     review_band_upper: 0.90
 *     weights: { outcome: 0.5, rule: 0.3, tier: 0.2 }
 *     similar_case_limit: 10
 *     preview_limit: 5
 *   logging:
 *     level: info
 *
 * The result is validated. Throws ConfigError on malformed YAML or bad values.
 */
EngineConfig load_config(const std::string& yaml_text);
EngineConfig load_config_file(const std::string& path);

} // namespace grievance
