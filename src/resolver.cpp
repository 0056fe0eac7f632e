#include "grievance/resolver.hpp"

#include <stdexcept>

namespace grievance {

const char* const kAuthorityPrecedence   = "Authority Precedence";
const char* const kSalienceBasedPriority = "Salience-Based Priority";
const char* const kTemporalPrecedence    = "Temporal Precedence";
const char* const kDeterministicTiebreak = "Deterministic Tiebreak (rule conflict)";
const char* const kNoMatchRuleId         = "Default_Review_Required";

namespace {

const char* kComponent = "resolver";

std::string date_text(const std::optional<Date>& d) {
    return d ? to_string(*d) : std::string("no effective date");
}

ConflictParty party_of(const Firing& f) {
    return { f.rule_id, f.tier, f.salience, f.effective_date, f.outcome->outcome };
}

std::string conflict_reason(ConflictKind kind, const Firing& winner, const Firing& loser) {
    switch (kind) {
        case ConflictKind::Authority:
            return to_string(winner.tier) + " supersedes " + to_string(loser.tier) +
                   " based on authority precedence";
        case ConflictKind::Salience:
            return "'" + winner.rule_id + "' (salience " + std::to_string(winner.salience) +
                   ") outranks '" + loser.rule_id + "' (salience " +
                   std::to_string(loser.salience) + ") within " + to_string(winner.tier);
        case ConflictKind::Temporal:
            return "'" + winner.rule_id + "' (effective " + date_text(winner.effective_date) +
                   ") supersedes '" + loser.rule_id + "' (effective " +
                   date_text(loser.effective_date) + ") as the more recent regulation";
        case ConflictKind::Undetermined:
            return "'" + winner.rule_id + "' and '" + loser.rule_id +
                   "' share tier, salience and effective date; '" + winner.rule_id +
                   "' selected by rule id order. The rule set should be corrected";
    }
    return "";
}

const char* strategy_for(ConflictKind kind) {
    switch (kind) {
        case ConflictKind::Authority:    return kAuthorityPrecedence;
        case ConflictKind::Salience:     return kSalienceBasedPriority;
        case ConflictKind::Temporal:     return kTemporalPrecedence;
        case ConflictKind::Undetermined: return kDeterministicTiebreak;
    }
    return kDeterministicTiebreak;
}

Decision decision_from(const Firing& winner) {
    const auto& out = *winner.outcome;
    Decision d;
    d.outcome               = out.outcome;
    d.applicable_rule_id    = winner.rule_id;
    d.tier                  = winner.tier;
    d.salience              = winner.salience;
    d.reason                = out.reason;
    d.regulatory_source     = out.regulatory_source;
    d.action_required       = out.action_required;
    d.human_review_required = out.human_review_required;
    return d;
}

Decision no_match_decision() {
    Decision d;
    d.outcome               = Outcome::PendingClarification;
    d.applicable_rule_id    = kNoMatchRuleId;
    d.tier                  = AuthorityTier::L3_University;
    d.salience              = 0;
    d.reason                = "No applicable rule matched";
    d.regulatory_source     = "University General Rules";
    d.action_required       = "Provide additional details";
    d.human_review_required = true;
    return d;
}

} // namespace

// ── ConflictKind ──────────────────────────────────────────────────────────────

std::string to_string(ConflictKind k) {
    switch (k) {
        case ConflictKind::Authority:    return "AUTHORITY_CONFLICT";
        case ConflictKind::Salience:     return "SALIENCE_CONFLICT";
        case ConflictKind::Temporal:     return "TEMPORAL_CONFLICT";
        case ConflictKind::Undetermined: return "UNDETERMINED_CONFLICT";
    }
    return "UNKNOWN";
}

ConflictKind parse_conflict_kind(const std::string& text) {
    if (text == "AUTHORITY_CONFLICT")    return ConflictKind::Authority;
    if (text == "SALIENCE_CONFLICT")     return ConflictKind::Salience;
    if (text == "TEMPORAL_CONFLICT")     return ConflictKind::Temporal;
    if (text == "UNDETERMINED_CONFLICT") return ConflictKind::Undetermined;
    throw std::invalid_argument("unknown conflict kind '" + text + "'");
}

std::vector<std::string> Conflict::conflicting_rule_ids() const {
    std::vector<std::string> ids;
    ids.reserve(parties.size());
    for (const auto& p : parties) ids.push_back(p.rule_id);
    return ids;
}

// ── Precedence ────────────────────────────────────────────────────────────────

bool takes_precedence(const Firing& a, const Firing& b) {
    if (a.tier != b.tier)         return a.tier < b.tier;
    if (a.salience != b.salience) return a.salience > b.salience;
    if (a.effective_date != b.effective_date) {
        if (!b.effective_date) return true;
        if (!a.effective_date) return false;
        return *a.effective_date > *b.effective_date;
    }
    return a.rule_id < b.rule_id;
}

ConflictKind classify(const Firing& a, const Firing& b) {
    if (a.tier != b.tier)                     return ConflictKind::Authority;
    if (a.salience != b.salience)             return ConflictKind::Salience;
    if (a.effective_date != b.effective_date) return ConflictKind::Temporal;
    return ConflictKind::Undetermined;
}

// ── ConflictResolver ──────────────────────────────────────────────────────────

Resolution ConflictResolver::resolve(const std::vector<Firing>& firings, bool ambiguity_flag) const {
    std::vector<const Firing*> fired;
    for (const auto& f : firings)
        if (f.fired && f.outcome) fired.push_back(&f);

    Resolution result;
    if (fired.empty()) {
        if (logger_) logger_->warn(kComponent, "no applicable rule matched; human review required");
        result.decision = no_match_decision();
        return result;
    }

    const Firing* winner = fired.front();
    for (const auto* f : fired)
        if (takes_precedence(*f, *winner)) winner = f;

    for (std::size_t i = 0; i < fired.size(); ++i) {
        for (std::size_t j = i + 1; j < fired.size(); ++j) {
            const Firing& a = *fired[i];
            const Firing& b = *fired[j];
            if (a.outcome->outcome == b.outcome->outcome) continue;

            const Firing& pair_winner = takes_precedence(a, b) ? a : b;
            const Firing& pair_loser  = &pair_winner == &a ? b : a;
            auto kind = classify(a, b);

            Conflict c;
            c.kind                = kind;
            c.parties             = { party_of(pair_winner), party_of(pair_loser) };
            c.winning_rule_id     = pair_winner.rule_id;
            c.resolution_strategy = strategy_for(kind);
            c.reason              = conflict_reason(kind, pair_winner, pair_loser);

            if (logger_) {
                auto level = kind == ConflictKind::Undetermined ? LogLevel::Warn : LogLevel::Info;
                logger_->log(level, kComponent, to_string(kind) + ": '" + pair_winner.rule_id +
                             "' over '" + pair_loser.rule_id + "'");
            }
            result.conflicts.push_back(std::move(c));
        }
    }

    result.decision = decision_from(*winner);
    result.decision.human_review_required =
        result.decision.human_review_required || ambiguity_flag;
    return result;
}

} // namespace grievance
