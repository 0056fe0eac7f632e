#include "grievance/config.hpp"

#include <cmath>
#include <yaml-cpp/yaml.h>

namespace grievance {

namespace {

void read_double(const YAML::Node& node, const char* key, double& out) {
    if (node[key]) out = node[key].as<double>();
}

void read_limit(const YAML::Node& node, const char* key, std::size_t& out) {
    if (!node[key]) return;
    auto value = node[key].as<long long>();
    if (value <= 0) {
        throw ConfigError(std::string("fairness.") + key + " must be positive");
    }
    out = static_cast<std::size_t>(value);
}

EngineConfig from_node(const YAML::Node& root) {
    EngineConfig config;
    if (!root || root.IsNull()) return config;
    if (!root.IsMap()) throw ConfigError("configuration root must be a map");

    if (const auto fairness = root["fairness"]) {
        read_double(fairness, "consistency_threshold", config.consistency_threshold);
        read_double(fairness, "review_band_upper", config.review_band_upper);
        if (const auto weights = fairness["weights"]) {
            read_double(weights, "outcome", config.outcome_weight);
            read_double(weights, "rule", config.rule_weight);
            read_double(weights, "tier", config.tier_weight);
        }
        read_limit(fairness, "similar_case_limit", config.similar_case_limit);
        read_limit(fairness, "preview_limit", config.preview_limit);
    }

    if (const auto logging = root["logging"]) {
        if (logging["level"]) {
            try {
                config.log_level = parse_log_level(logging["level"].as<std::string>());
            } catch (const std::invalid_argument& e) {
                throw ConfigError(std::string("logging.level: ") + e.what());
            }
        }
    }

    config.validate();
    return config;
}

} // namespace

void EngineConfig::validate() const {
    if (!std::isfinite(consistency_threshold) || !std::isfinite(review_band_upper))
        throw ConfigError("consistency_threshold and review_band_upper must be finite");
    if (!std::isfinite(outcome_weight) || !std::isfinite(rule_weight) || !std::isfinite(tier_weight))
        throw ConfigError("fairness weights must be finite");
    if (consistency_threshold < 0.0 || consistency_threshold > 1.0)
        throw ConfigError("consistency_threshold must be within [0, 1]");
    if (review_band_upper < consistency_threshold || review_band_upper > 1.0)
        throw ConfigError("review_band_upper must be within [consistency_threshold, 1]");
    if (outcome_weight < 0.0 || rule_weight < 0.0 || tier_weight < 0.0)
        throw ConfigError("fairness weights must not be negative");
    if (std::fabs(outcome_weight + rule_weight + tier_weight - 1.0) > 1e-9)
        throw ConfigError("fairness weights must sum to 1");
    if (similar_case_limit == 0 || preview_limit == 0)
        throw ConfigError("similar_case_limit and preview_limit must be positive");
}

EngineConfig load_config(const std::string& yaml_text) {
    try {
        return from_node(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
}

EngineConfig load_config_file(const std::string& path) {
    try {
        return from_node(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("invalid configuration file '" + path + "': " + e.what());
    }
}

} // namespace grievance
