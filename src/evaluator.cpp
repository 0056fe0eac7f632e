#include "grievance/evaluator.hpp"

#include <algorithm>
#include <exception>

namespace grievance {

namespace {

const char* kComponent = "evaluator";

bool compare_ordered(CompareOp op, const ParamValue& actual, const ParamValue& expected) {
    const auto* a_num = std::get_if<double>(&actual);
    const auto* e_num = std::get_if<double>(&expected);
    if (a_num && e_num) {
        switch (op) {
            case CompareOp::Lt: return *a_num <  *e_num;
            case CompareOp::Le: return *a_num <= *e_num;
            case CompareOp::Gt: return *a_num >  *e_num;
            case CompareOp::Ge: return *a_num >= *e_num;
            default:            return false;
        }
    }

    const auto* a_str = std::get_if<std::string>(&actual);
    const auto* e_str = std::get_if<std::string>(&expected);
    if (a_str && e_str) {
        switch (op) {
            case CompareOp::Lt: return *a_str <  *e_str;
            case CompareOp::Le: return *a_str <= *e_str;
            case CompareOp::Gt: return *a_str >  *e_str;
            case CompareOp::Ge: return *a_str >= *e_str;
            default:            return false;
        }
    }
    return false;  // bools and mixed types have no ordering
}

FiredOutcome render_outcome(const OutcomeTemplate& tpl, const Parameters& params) {
    FiredOutcome out;
    out.outcome               = tpl.outcome;
    out.reason                = render_template(tpl.reason, params);
    out.regulatory_source     = tpl.regulatory_source;
    out.action_required       = render_template(tpl.action_required, params);
    out.human_review_required = tpl.human_review_required;
    return out;
}

} // namespace

// ── Conditions ────────────────────────────────────────────────────────────────

ConditionCheck check_condition(const Condition& condition, const Parameters& params) {
    ConditionCheck check;
    check.expression = condition.expression();
    check.observed   = find_param(params, condition.field);

    if (!check.observed) {
        check.satisfied = false;
        return check;
    }

    const ParamValue& actual = *check.observed;
    switch (condition.op) {
        case CompareOp::Exists:
            check.satisfied = true;
            break;
        case CompareOp::IsTrue:
        case CompareOp::IsFalse: {
            const auto* b = std::get_if<bool>(&actual);
            check.satisfied = b && (*b == (condition.op == CompareOp::IsTrue));
            break;
        }
        case CompareOp::Eq:
            check.satisfied = actual.index() == condition.expected.index() &&
                              actual == condition.expected;
            break;
        case CompareOp::Ne:
            check.satisfied = actual.index() == condition.expected.index() &&
                              actual != condition.expected;
            break;
        case CompareOp::In: {
            const auto* s = std::get_if<std::string>(&actual);
            check.satisfied = s && std::find(condition.choices.begin(),
                                             condition.choices.end(), *s)
                                   != condition.choices.end();
            break;
        }
        case CompareOp::Lt:
        case CompareOp::Le:
        case CompareOp::Gt:
        case CompareOp::Ge:
            check.satisfied = compare_ordered(condition.op, actual, condition.expected);
            break;
    }
    return check;
}

// ── RuleEvaluator ─────────────────────────────────────────────────────────────

std::vector<Firing> RuleEvaluator::evaluate(const GrievanceFacts& facts,
                                            const std::vector<Rule>& rules) const {
    std::vector<const Rule*> ordered;
    ordered.reserve(rules.size());
    for (const auto& r : rules) ordered.push_back(&r);
    std::sort(ordered.begin(), ordered.end(),
              [](const Rule* a, const Rule* b) { return a->id < b->id; });

    std::vector<Firing> firings;
    firings.reserve(ordered.size());
    for (const auto* rule : ordered) {
        firings.push_back(evaluate_rule(facts, *rule));
    }

    if (logger_ && logger_->enabled(LogLevel::Debug)) {
        auto fired = std::count_if(firings.begin(), firings.end(),
                                   [](const Firing& f) { return f.fired; });
        logger_->debug(kComponent, "grievance '" + facts.id + "' (" + facts.type + "): " +
                       std::to_string(fired) + " of " + std::to_string(firings.size()) +
                       " rules fired");
    }
    return firings;
}

Firing RuleEvaluator::evaluate_rule(const GrievanceFacts& facts, const Rule& rule) const {
    Firing firing;
    firing.rule_id        = rule.id;
    firing.tier           = rule.tier;
    firing.salience       = rule.salience;
    firing.effective_date = rule.effective_date;

    if (const auto* set = std::get_if<ConditionSet>(&rule.applicability)) {
        ConditionCheck type_check;
        type_check.expression = "type == '" + set->grievance_type + "'";
        type_check.satisfied  = facts.type == set->grievance_type;
        type_check.observed   = ParamValue{ facts.type };
        firing.conditions_checked.push_back(type_check);

        // A rule for another grievance type has nothing further worth recording.
        if (!type_check.satisfied) return firing;

        bool all_hold = true;
        for (const auto& condition : set->conditions) {
            auto check = check_condition(condition, facts.parameters);
            all_hold = all_hold && check.satisfied;
            firing.conditions_checked.push_back(std::move(check));
        }
        firing.fired = all_hold;
    } else {
        const auto& predicate = std::get<CustomPredicate>(rule.applicability);
        ConditionCheck check;
        check.expression = predicate.description;
        try {
            check.satisfied = predicate.fn && predicate.fn(facts);
        } catch (const std::exception& e) {
            check.satisfied = false;
            check.observed  = ParamValue{ std::string("exception: ") + e.what() };
        } catch (...) {
            check.satisfied = false;
            check.observed  = ParamValue{ std::string("exception: non-standard exception") };
        }
        if (check.observed && logger_) {
            logger_->warn(kComponent, "rule '" + rule.id + "' predicate failed: " +
                          to_string(*check.observed));
        }
        firing.fired = check.satisfied;
        firing.conditions_checked.push_back(std::move(check));
    }

    if (firing.fired) {
        firing.outcome = render_outcome(rule.outcome, facts.parameters);
    }
    return firing;
}

} // namespace grievance
