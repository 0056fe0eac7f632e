#include "grievance/engine.hpp"

#include <chrono>
#include <utility>

namespace grievance {

namespace {
const char* kComponent = "engine";
}

GrievanceEngine::GrievanceEngine(EngineConfig config, const Logger* logger)
    : logger_(logger),
      evaluator_(logger),
      resolver_(logger),
      scorer_(std::move(config), logger) {}

Adjudication GrievanceEngine::adjudicate(const GrievanceFacts& facts,
                                         const std::vector<Rule>& rules,
                                         bool ambiguity_flag) const {
    if (logger_) {
        logger_->info(kComponent, "evaluating grievance '" + facts.id + "' (type: " + facts.type +
                      ") against " + std::to_string(rules.size()) + " rules");
    }

    const auto start = std::chrono::steady_clock::now();
    auto firings     = evaluator_.evaluate(facts, rules);
    auto resolution  = resolver_.resolve(firings, ambiguity_flag);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    Adjudication result;
    result.explanation = explain(resolution.conflicts, resolution.decision);
    result.trace = build_trace(facts.id, std::move(firings), std::move(resolution.conflicts),
                               std::move(resolution.decision), elapsed);

    if (logger_) {
        const auto& d = result.trace.decision;
        logger_->info(kComponent, "grievance '" + facts.id + "' -> " + to_string(d.outcome) +
                      " <- " + d.applicable_rule_id + " (" + conflict_summary(result.trace.conflicts) +
                      (d.human_review_required ? ", human review required)" : ")"));
    }
    return result;
}

FairnessReport GrievanceEngine::assess(const Decision& decision,
                                       const std::vector<SimilarCase>& similar_cases) const {
    return scorer_.score(decision, similar_cases);
}

} // namespace grievance
