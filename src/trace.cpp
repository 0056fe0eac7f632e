#include "grievance/trace.hpp"

#include <cctype>
#include <sstream>
#include <utility>

namespace grievance {

namespace {

std::string rule_list(const Conflict& c) {
    std::ostringstream os;
    for (std::size_t i = 0; i < c.parties.size(); ++i) {
        const auto& p = c.parties[i];
        if (i > 0) os << "\n";
        os << "- " << p.rule_id << " (" << to_string(p.tier) << ", salience " << p.salience;
        if (p.effective_date) os << ", effective " << to_string(*p.effective_date);
        os << ") -> " << to_string(p.outcome);
    }
    return os.str();
}

std::string explain_authority(const Conflict& c) {
    std::ostringstream os;
    os << "**Authority Conflict Detected**\n\n"
       << "**Conflicting Rules:**\n" << rule_list(c) << "\n\n"
       << "**Resolution:**\n"
       << "The rule '" << c.winning_rule_id << "' was selected based on the established regulatory hierarchy:\n"
       << "- " << tier_label(AuthorityTier::L1_National) << " > "
       << tier_label(AuthorityTier::L2_Accreditation) << " > "
       << tier_label(AuthorityTier::L3_University) << "\n\n"
       << "**Rationale:**\n" << c.reason << ".\n\n"
       << "**Legal Principle:**\n"
       << "National regulations supersede accreditation standards, which in turn supersede "
       << "university policy. A rule from a higher tier prevails regardless of the priority "
       << "or date of a lower-tier rule.\n\n"
       << "**Resolution Strategy:** " << c.resolution_strategy;
    return os.str();
}

std::string explain_salience(const Conflict& c) {
    std::ostringstream os;
    os << "**Salience Conflict Detected**\n\n"
       << "**Conflicting Rules (Same Hierarchy Level):**\n" << rule_list(c) << "\n\n"
       << "**Resolution:**\n"
       << "The rule '" << c.winning_rule_id << "' was selected based on higher salience (priority score).\n\n"
       << "**Rationale:**\n" << c.reason << ".\n\n"
       << "**Priority Principle:**\n"
       << "Within one authority tier, the rule with the higher priority score prevails. Higher "
       << "scores are assigned to exceptions over general rules, specific conditions over broad "
       << "ones, and mandatory provisions over discretionary ones.\n\n"
       << "**Resolution Strategy:** " << c.resolution_strategy;
    return os.str();
}

std::string explain_temporal(const Conflict& c) {
    std::ostringstream os;
    os << "**Temporal Conflict Detected**\n\n"
       << "**Conflicting Rules (Different Effective Dates):**\n" << rule_list(c) << "\n\n"
       << "**Resolution:**\n"
       << "The rule '" << c.winning_rule_id << "' was selected based on effective date precedence.\n\n"
       << "**Rationale:**\n" << c.reason << ".\n\n"
       << "**Legal Principle:**\n"
       << "When regulations of equal standing are amended or superseded, the most recent "
       << "regulation takes precedence unless explicitly stated otherwise.\n\n"
       << "**Resolution Strategy:** " << c.resolution_strategy;
    return os.str();
}

std::string explain_generic(const Conflict& c) {
    std::ostringstream os;
    os << "**Conflict Detected**\n\n"
       << "**Conflicting Rules:**\n" << rule_list(c) << "\n\n"
       << "**Resolution:**\n"
       << "The rule '" << c.winning_rule_id << "' was selected.\n\n"
       << "**Rationale:**\n" << c.reason << ".\n\n"
       << "**Resolution Strategy:** " << c.resolution_strategy;
    return os.str();
}

std::string title_case(const std::string& upper_snake) {
    std::string out;
    bool start = true;
    for (char ch : upper_snake) {
        if (ch == '_') {
            out += ' ';
            start = true;
            continue;
        }
        auto u = static_cast<unsigned char>(ch);
        out += static_cast<char>(start ? std::toupper(u) : std::tolower(u));
        start = false;
    }
    return out;
}

} // namespace

std::string tier_label(AuthorityTier tier) {
    switch (tier) {
        case AuthorityTier::L1_National:      return "L1 (National Law)";
        case AuthorityTier::L2_Accreditation: return "L2 (Accreditation Standards)";
        case AuthorityTier::L3_University:    return "L3 (University Policy)";
    }
    return "Unknown";
}

Trace build_trace(std::string grievance_id,
                  std::vector<Firing> firings,
                  std::vector<Conflict> conflicts,
                  Decision decision,
                  std::int64_t elapsed_ms) {
    Trace t;
    t.grievance_id           = std::move(grievance_id);
    t.firings                = std::move(firings);
    t.conflicts              = std::move(conflicts);
    t.decision               = std::move(decision);
    t.processing_duration_ms = elapsed_ms < 0 ? 0 : elapsed_ms;
    return t;
}

Explanation explain(const std::vector<Conflict>& conflicts, const Decision& decision) {
    Explanation e;
    e.conflicts_count        = conflicts.size();
    e.final_decision_context = final_decision_context(decision, conflicts.size());

    if (conflicts.empty()) {
        e.summary             = "No conflicts detected";
        e.resolution_strategy = "N/A";
        if (decision.applicable_rule_id == kNoMatchRuleId) {
            e.narrative = "No rule was applicable to this grievance. It has been referred for human review.";
        } else {
            e.narrative = "Only one rule, or only rules in agreement, applied to this grievance. "
                          "The decision is attributed to '" + decision.applicable_rule_id + "'.";
        }
        return e;
    }

    std::string narrative;
    for (const auto& c : conflicts) {
        if (!narrative.empty()) narrative += "\n\n";
        switch (c.kind) {
            case ConflictKind::Authority:    narrative += explain_authority(c); break;
            case ConflictKind::Salience:     narrative += explain_salience(c);  break;
            case ConflictKind::Temporal:     narrative += explain_temporal(c);  break;
            case ConflictKind::Undetermined: narrative += explain_generic(c);   break;
        }
    }

    e.summary             = std::to_string(conflicts.size()) + " conflict(s) detected and resolved";
    e.narrative           = std::move(narrative);
    e.resolution_strategy = conflicts.front().resolution_strategy;
    return e;
}

std::string conflict_summary(const std::vector<Conflict>& conflicts) {
    if (conflicts.empty()) return "No conflicts";

    std::vector<std::pair<ConflictKind, std::size_t>> counts;
    for (const auto& c : conflicts) {
        bool seen = false;
        for (auto& entry : counts) {
            if (entry.first == c.kind) {
                ++entry.second;
                seen = true;
                break;
            }
        }
        if (!seen) counts.emplace_back(c.kind, 1);
    }

    std::string out;
    for (const auto& entry : counts) {
        if (!out.empty()) out += ", ";
        out += std::to_string(entry.second) + " " + title_case(to_string(entry.first));
    }
    return out;
}

std::string final_decision_context(const Decision& decision, std::size_t conflicts_count) {
    std::ostringstream os;
    os << "**Final Decision:** " << to_string(decision.outcome) << "\n\n"
       << "**Applicable Rule:** " << decision.applicable_rule_id << "\n\n"
       << "**Hierarchy Level:** " << to_string(decision.tier) << "\n\n"
       << "**Regulatory Source:** " << decision.regulatory_source << "\n\n"
       << "**Why This Decision:**\n";
    if (conflicts_count > 0) {
        os << "After resolving " << conflicts_count << " conflict(s), this decision represents the "
           << "highest-precedence rule applicable to this grievance, from "
           << tier_label(decision.tier) << ".\n\n";
    } else {
        os << decision.reason << ".\n\n";
    }
    if (!decision.action_required.empty()) {
        os << "**Action Required:** " << decision.action_required << "\n\n";
    }
    os << "**Human Review Required:** " << (decision.human_review_required ? "Yes" : "No");
    return os.str();
}

} // namespace grievance
