#pragma once

#include "grievance/log.hpp"
#include "grievance/rule.hpp"
#include "grievance/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace grievance {

struct ConditionCheck {
    std::string               expression;
    bool                      satisfied = false;
    std::optional<ParamValue> observed;     // empty when the parameter was absent
};

/// The rule's outcome template with placeholders filled in from the facts.
struct FiredOutcome {
    Outcome     outcome = Outcome::PendingClarification;
    std::string reason;
    std::string regulatory_source;
    std::string action_required;
    bool        human_review_required = false;
};

/// Result of testing one rule against one grievance. `outcome` is set only when fired.
struct Firing {
    std::string                 rule_id;
    AuthorityTier               tier     = AuthorityTier::L3_University;
    int                         salience = 0;
    std::optional<Date>         effective_date;
    bool                        fired    = false;
    std::vector<ConditionCheck> conditions_checked;
    std::optional<FiredOutcome> outcome;
};

/**
 * RuleEvaluator
 *
 * Tests every candidate rule against a grievance and records one Firing per
 * rule, fired or not, in ascending rule-id order so traces are reproducible
 * regardless of how the caller ordered the rule list.
 *
 * Never throws for well-typed facts: missing parameters fail their condition,
 * and a custom predicate that throws is recorded as not fired with the
 * exception message in its condition check.
 */
class RuleEvaluator {
public:
    explicit RuleEvaluator(const Logger* logger = nullptr) : logger_(logger) {}

    std::vector<Firing> evaluate(const GrievanceFacts& facts,
                                 const std::vector<Rule>& rules) const;

    std::vector<Firing> evaluate(const GrievanceFacts& facts, const RuleSet& rules) const {
        return evaluate(facts, rules.rules());
    }

private:
    Firing evaluate_rule(const GrievanceFacts& facts, const Rule& rule) const;

    const Logger* logger_;
};

/// Tests a single condition; total over all parameter values.
ConditionCheck check_condition(const Condition& condition, const Parameters& params);

} // namespace grievance
