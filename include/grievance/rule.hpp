#pragma once

#include "grievance/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace grievance {

enum class CompareOp { Eq, Ne, Lt, Le, Gt, Ge, In, Exists, IsTrue, IsFalse };

std::string to_string(CompareOp op);   // "==", "<", "in", "exists", ...
CompareOp   parse_op(const std::string& text);

inline std::ostream& operator<<(std::ostream& os, CompareOp op) { return os << to_string(op); }

/// One test against a single parameter, e.g. `attendance_percentage < 75`.
struct Condition {
    std::string              field;
    CompareOp                op = CompareOp::Exists;
    ParamValue               expected = false;   // unused for In/Exists/IsTrue/IsFalse
    std::vector<std::string> choices;            // In only

    std::string expression() const;
};

// ── Applicability ────────────────────────────────────────────────────────────

/// Declarative form: the grievance type must match and every condition must hold.
struct ConditionSet {
    std::string            grievance_type;
    std::vector<Condition> conditions;
};

/// Escape hatch for logic the condition language cannot express.
/// The function may throw; the evaluator records the throw as "not fired".
struct CustomPredicate {
    std::string                                description;
    std::function<bool(const GrievanceFacts&)> fn;
};

using Applicability = std::variant<ConditionSet, CustomPredicate>;

// ── Rule ─────────────────────────────────────────────────────────────────────

struct OutcomeTemplate {
    Outcome     outcome = Outcome::PendingClarification;
    std::string reason;               // may reference {parameter} placeholders
    std::string regulatory_source;
    std::string action_required;      // empty when none
    bool        human_review_required = false;
};

struct Provenance {
    std::string title;
    std::string authority;            // "UGC", "NBA", "University", ...
    std::string category;             // "Attendance", "Examination", "Fee", ...
    std::string description;
};

struct Rule {
    std::string          id;
    AuthorityTier        tier     = AuthorityTier::L3_University;
    int                  salience = 0;
    std::optional<Date>  effective_date;
    Applicability        applicability;
    OutcomeTemplate      outcome;
    Provenance           provenance;
};

/// Replaces `{name}` with the parameter's rendered value. Unknown names stay verbatim.
std::string render_template(const std::string& text, const Parameters& params);

/**
 * RuleSet
 *
 * Owned, validated collection of rules as supplied by the rule repository.
 * Ids are unique; insertion order is preserved but carries no meaning for
 * evaluation, which always runs in ascending id order.
 */
class RuleSet {
public:
    /// Throws std::invalid_argument on an empty or duplicate id.
    void add(Rule rule);

    const std::vector<Rule>& rules() const { return rules_; }
    std::size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

    const Rule* find(const std::string& id) const;

    std::vector<const Rule*> by_tier(AuthorityTier tier) const;
    std::vector<const Rule*> by_category(const std::string& category) const;
    std::vector<const Rule*> by_authority(const std::string& authority) const;

private:
    std::vector<Rule> rules_;
};

// ── Built-in regulations ─────────────────────────────────────────────────────

/// The academic regulations of rules/academic_rules.yaml, compiled into the
/// library: UGC attendance, NBA lab attendance, university revaluation and
/// national / university fee waivers.
RuleSet default_rule_set();

} // namespace grievance
