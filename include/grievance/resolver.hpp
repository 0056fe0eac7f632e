#pragma once

#include "grievance/evaluator.hpp"
#include "grievance/log.hpp"
#include "grievance/types.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace grievance {

// Undetermined: tier, salience and date all equal yet outcomes differ (a rule-authoring defect).
enum class ConflictKind { Authority, Salience, Temporal, Undetermined };

std::string  to_string(ConflictKind k);   // "AUTHORITY_CONFLICT", ...
ConflictKind parse_conflict_kind(const std::string& text);

inline std::ostream& operator<<(std::ostream& os, ConflictKind k) { return os << to_string(k); }

// Resolution strategy names as they appear in traces.
extern const char* const kAuthorityPrecedence;
extern const char* const kSalienceBasedPriority;
extern const char* const kTemporalPrecedence;
extern const char* const kDeterministicTiebreak;

/// Id of the synthetic rule a no-match decision is attributed to.
extern const char* const kNoMatchRuleId;

struct ConflictParty {
    std::string         rule_id;
    AuthorityTier       tier     = AuthorityTier::L3_University;
    int                 salience = 0;
    std::optional<Date> effective_date;
    Outcome             outcome  = Outcome::PendingClarification;
};

/// Disagreement between two fired rules. Parties are ordered winner first.
struct Conflict {
    ConflictKind               kind = ConflictKind::Authority;
    std::vector<ConflictParty> parties;
    std::string                winning_rule_id;
    std::string                resolution_strategy;
    std::string                reason;

    std::vector<std::string> conflicting_rule_ids() const;
};

struct Decision {
    Outcome       outcome  = Outcome::PendingClarification;
    std::string   applicable_rule_id;
    AuthorityTier tier     = AuthorityTier::L3_University;
    int           salience = 0;
    std::string   reason;
    std::string   regulatory_source;
    std::string   action_required;          // empty when none
    bool          human_review_required = false;
};

struct Resolution {
    Decision              decision;
    std::vector<Conflict> conflicts;
};

/**
 * Precedence between two fired rules: tier ascending (L1 first), then
 * salience descending, then effective date descending (an undated rule
 * ranks below any dated one), then rule id ascending. Returns true when
 * `a` takes precedence over `b`. Total for distinct rule ids.
 */
bool takes_precedence(const Firing& a, const Firing& b);

/// Classifies why two disagreeing firings differ, by the first precedence key that separates them.
ConflictKind classify(const Firing& a, const Firing& b);

/**
 * ConflictResolver
 *
 * Turns the evaluator's firings into exactly one Decision.
 *
 * Resolution:
 *   1. No fired rule: PENDING_CLARIFICATION with human review required.
 *   2. One fired rule: it is the decision.
 *   3. Several fired rules: the global winner under `takes_precedence`
 *      decides. Every pair of fired rules whose outcomes differ is recorded
 *      as a Conflict; rules that agree are never reported.
 *
 * The ambiguity flag only forces human review; it never changes the outcome.
 */
class ConflictResolver {
public:
    explicit ConflictResolver(const Logger* logger = nullptr) : logger_(logger) {}

    Resolution resolve(const std::vector<Firing>& firings, bool ambiguity_flag = false) const;

private:
    const Logger* logger_;
};

} // namespace grievance
