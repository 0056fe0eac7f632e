#include "grievance/rule_loader.hpp"

#include <sstream>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace grievance {

// ── Error formatting ──────────────────────────────────────────────────────────

namespace {

std::string render(const std::string& where, const std::string& message) {
    std::ostringstream oss;
    oss << "rule error";
    if (!where.empty()) oss << " [" << where << "]";
    oss << ": " << message;
    return oss.str();
}

} // namespace

RuleLoadError::RuleLoadError(std::string where, std::string message)
    : std::runtime_error(render(where, message)),
      where_(std::move(where)),
      message_(std::move(message)) {}

std::string RuleLoadError::format() const {
    return render(where_, message_);
}

// ── Parse helpers ─────────────────────────────────────────────────────────────

namespace {

std::string required_string(const YAML::Node& node, const char* key) {
    const auto value = node[key];
    if (!value || !value.IsScalar()) {
        throw std::invalid_argument(std::string("missing required field '") + key + "'");
    }
    return value.as<std::string>();
}

std::string optional_string(const YAML::Node& node, const char* key) {
    const auto value = node[key];
    if (!value || value.IsNull()) return {};
    return value.as<std::string>();
}

ParamValue parse_value(const YAML::Node& node) {
    if (!node.IsScalar()) {
        throw std::invalid_argument("condition value must be a scalar");
    }
    const std::string& text = node.Scalar();

    // Quoted scalars carry the non-specific tag "!".
    if (node.Tag() == "!") return text;

    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag)) return flag;

    double number = 0.0;
    if (YAML::convert<double>::decode(node, number)) return number;
    return text;
}

Condition parse_condition(const YAML::Node& node) {
    if (!node.IsMap()) throw std::invalid_argument("condition must be a map");

    Condition c;
    c.field = required_string(node, "field");
    c.op    = parse_op(required_string(node, "op"));

    switch (c.op) {
        case CompareOp::In: {
            const auto values = node["values"];
            if (!values || !values.IsSequence() || values.size() == 0) {
                throw std::invalid_argument("'in' condition on '" + c.field +
                                            "' needs a non-empty 'values' list");
            }
            for (const auto& v : values) c.choices.push_back(v.as<std::string>());
            break;
        }
        case CompareOp::Exists:
        case CompareOp::IsTrue:
        case CompareOp::IsFalse:
            break;
        default:
            if (!node["value"]) {
                throw std::invalid_argument("condition on '" + c.field + "' needs a 'value'");
            }
            c.expected = parse_value(node["value"]);
            break;
    }
    return c;
}

Rule parse_rule(const YAML::Node& node) {
    if (!node.IsMap()) throw std::invalid_argument("rule entry must be a map");

    Rule r;
    r.id   = required_string(node, "id");
    r.tier = parse_tier(required_string(node, "tier"));

    if (node["salience"]) {
        r.salience = node["salience"].as<int>();
        if (r.salience < 0) throw std::invalid_argument("salience must not be negative");
    }

    const auto date_text = optional_string(node, "effective_date");
    if (!date_text.empty()) {
        r.effective_date = parse_date(date_text);
        if (!r.effective_date) {
            throw std::invalid_argument("effective_date '" + date_text + "' is not YYYY-MM-DD");
        }
    }

    ConditionSet applicability;
    applicability.grievance_type = required_string(node, "grievance_type");
    if (const auto conditions = node["conditions"]) {
        if (!conditions.IsSequence()) throw std::invalid_argument("'conditions' must be a list");
        for (const auto& c : conditions) applicability.conditions.push_back(parse_condition(c));
    }
    r.applicability = std::move(applicability);

    const auto outcome = node["outcome"];
    if (!outcome || !outcome.IsMap()) throw std::invalid_argument("missing required map 'outcome'");
    r.outcome.outcome           = parse_outcome(required_string(outcome, "decision"));
    r.outcome.reason            = required_string(outcome, "reason");
    r.outcome.regulatory_source = optional_string(outcome, "regulatory_source");
    r.outcome.action_required   = optional_string(outcome, "action_required");
    if (outcome["human_review_required"]) {
        r.outcome.human_review_required = outcome["human_review_required"].as<bool>();
    }

    if (const auto meta = node["metadata"]) {
        r.provenance.title       = optional_string(meta, "title");
        r.provenance.authority   = optional_string(meta, "authority");
        r.provenance.category    = optional_string(meta, "category");
        r.provenance.description = optional_string(meta, "description");
    }
    return r;
}

RuleSet from_document(const YAML::Node& root, const std::string& origin) {
    if (!root.IsMap() || !root["rules"] || !root["rules"].IsSequence()) {
        throw RuleLoadError(origin, "document must contain a 'rules' list");
    }

    RuleSet set;
    std::size_t index = 0;
    for (const auto& node : root["rules"]) {
        std::string where = origin + "rules[" + std::to_string(index) + "]";
        if (node.IsMap() && node["id"] && node["id"].IsScalar()) {
            where += " " + node["id"].Scalar();
        }
        try {
            set.add(parse_rule(node));
        } catch (const std::invalid_argument& e) {
            throw RuleLoadError(where, e.what());
        } catch (const YAML::Exception& e) {
            throw RuleLoadError(where, e.what());
        }
        ++index;
    }
    return set;
}

} // namespace

// ── Loading ───────────────────────────────────────────────────────────────────

RuleSet load_rules(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw RuleLoadError("", e.what());
    }
    return from_document(root, "");
}

RuleSet load_rules_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw RuleLoadError(path, e.what());
    }
    return from_document(root, path + ": ");
}

} // namespace grievance
