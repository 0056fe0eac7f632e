#pragma once

#include "grievance/config.hpp"
#include "grievance/evaluator.hpp"
#include "grievance/fairness.hpp"
#include "grievance/log.hpp"
#include "grievance/resolver.hpp"
#include "grievance/rule.hpp"
#include "grievance/trace.hpp"

#include <vector>

namespace grievance {

struct Adjudication {
    Trace       trace;
    Explanation explanation;

    const Decision& decision() const { return trace.decision; }
};

/**
 * GrievanceEngine
 *
 * Evaluates a grievance against the rule set supplied for this call,
 * resolves conflicts between fired rules and records the full trace.
 * Separately scores a decision against prior similar decisions.
 *
 * Holds configuration only; rule sets and similar cases are passed per call,
 * so one engine can serve concurrent evaluations and picks up reloaded rules
 * on the next call.
 */
class GrievanceEngine {
public:
    explicit GrievanceEngine(EngineConfig config = {}, const Logger* logger = nullptr);

    /// The ambiguity flag forces human review without changing the outcome.
    Adjudication adjudicate(const GrievanceFacts& facts,
                            const std::vector<Rule>& rules,
                            bool ambiguity_flag = false) const;

    Adjudication adjudicate(const GrievanceFacts& facts,
                            const RuleSet& rules,
                            bool ambiguity_flag = false) const {
        return adjudicate(facts, rules.rules(), ambiguity_flag);
    }

    FairnessReport assess(const Decision& decision,
                          const std::vector<SimilarCase>& similar_cases) const;

    const EngineConfig& config() const { return scorer_.config(); }

private:
    const Logger*    logger_;
    RuleEvaluator    evaluator_;
    ConflictResolver resolver_;
    FairnessScorer   scorer_;
};

} // namespace grievance
