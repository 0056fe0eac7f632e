#pragma once

#include "grievance/evaluator.hpp"
#include "grievance/resolver.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace grievance {

/// Full audit record for one evaluation. Firings are in evaluation order.
struct Trace {
    std::string           grievance_id;
    std::vector<Firing>   firings;
    std::vector<Conflict> conflicts;
    Decision              decision;
    std::int64_t          processing_duration_ms = 0;

    std::size_t fired_count() const {
        std::size_t count = 0;
        for (const auto& f : firings)
            if (f.fired) ++count;
        return count;
    }
    std::size_t not_fired_count() const { return firings.size() - fired_count(); }
};

struct Explanation {
    std::string summary;
    std::string narrative;
    std::string final_decision_context;
    std::string resolution_strategy;      // first conflict's strategy, "N/A" without conflicts
    std::size_t conflicts_count = 0;
};

Trace build_trace(std::string grievance_id,
                  std::vector<Firing> firings,
                  std::vector<Conflict> conflicts,
                  Decision decision,
                  std::int64_t elapsed_ms);

/// Renders what the resolver decided. Does not alter or re-derive the decision.
Explanation explain(const std::vector<Conflict>& conflicts, const Decision& decision);

/// One-line count per conflict kind, e.g. "1 Authority Conflict, 2 Salience Conflict".
std::string conflict_summary(const std::vector<Conflict>& conflicts);

std::string final_decision_context(const Decision& decision, std::size_t conflicts_count);

/// Human-readable tier label, e.g. "L1 (National Law)".
std::string tier_label(AuthorityTier tier);

} // namespace grievance
