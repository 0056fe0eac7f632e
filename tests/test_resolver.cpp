#include "grievance/resolver.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace grievance;

// ── Helpers ──────────────────────────────────────────────────────────────────

static Firing fired(const std::string& id, AuthorityTier tier, int salience,
                    const char* effective, Outcome outcome, bool review = false) {
    Firing f;
    f.rule_id        = id;
    f.tier           = tier;
    f.salience       = salience;
    f.effective_date = effective ? parse_date(effective) : std::nullopt;
    f.fired          = true;
    f.outcome        = FiredOutcome{ outcome, id + " reason", id + " source", "", review };
    return f;
}

static Firing not_fired(const std::string& id, AuthorityTier tier, int salience) {
    Firing f;
    f.rule_id  = id;
    f.tier     = tier;
    f.salience = salience;
    return f;
}

const auto L1 = AuthorityTier::L1_National;
const auto L2 = AuthorityTier::L2_Accreditation;
const auto L3 = AuthorityTier::L3_University;

static int passed = 0;
static int failed = 0;

#define ASSERT_EQ(label, expected, actual)                                  \
    do {                                                                    \
        if ((expected) == (actual)) {                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label                              \
                      << "  (expected=" << (expected)                      \
                      << " got=" << (actual) << ")\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

#define ASSERT_TRUE(label, expr)                                            \
    do {                                                                    \
        if ((expr)) {                                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label << "\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

// ── Test suites ───────────────────────────────────────────────────────────────

void test_no_match() {
    std::cout << "\n[NoMatch]\n";
    ConflictResolver resolver;

    auto empty = resolver.resolve({});
    ASSERT_EQ("empty -> PENDING_CLARIFICATION", Outcome::PendingClarification, empty.decision.outcome);
    ASSERT_TRUE("empty -> human review", empty.decision.human_review_required);
    ASSERT_TRUE("empty -> no conflicts", empty.conflicts.empty());
    ASSERT_EQ("attributed to default rule", std::string(kNoMatchRuleId), empty.decision.applicable_rule_id);
    ASSERT_EQ("reason", std::string("No applicable rule matched"), empty.decision.reason);

    auto none = resolver.resolve({ not_fired("A", L1, 10), not_fired("B", L3, 5) });
    ASSERT_EQ("nothing fired -> PENDING_CLARIFICATION", Outcome::PendingClarification, none.decision.outcome);
    ASSERT_TRUE("nothing fired -> human review", none.decision.human_review_required);
    ASSERT_TRUE("nothing fired -> no conflicts", none.conflicts.empty());
}

void test_single_rule() {
    std::cout << "\n[SingleRule]\n";
    ConflictResolver resolver;
    auto r = resolver.resolve({
        not_fired("A", L1, 1500),
        fired("B", L3, 1000, "2023-04-01", Outcome::Accept),
    });
    ASSERT_EQ("decision from the only fired rule", std::string("B"), r.decision.applicable_rule_id);
    ASSERT_EQ("outcome", Outcome::Accept, r.decision.outcome);
    ASSERT_EQ("tier", L3, r.decision.tier);
    ASSERT_EQ("salience", 1000, r.decision.salience);
    ASSERT_EQ("source", std::string("B source"), r.decision.regulatory_source);
    ASSERT_TRUE("no conflicts", r.conflicts.empty());
    ASSERT_TRUE("no review", !r.decision.human_review_required);
}

void test_authority_conflict() {
    std::cout << "\n[AuthorityConflict]\n";
    ConflictResolver resolver;
    auto r = resolver.resolve({
        fired("A", L1, 1500, "2018-07-18", Outcome::Reject),
        fired("B", L3, 500,  "2021-06-01", Outcome::Accept),
    });
    ASSERT_EQ("outcome REJECT", Outcome::Reject, r.decision.outcome);
    ASSERT_EQ("tier L1", L1, r.decision.tier);
    ASSERT_EQ("one conflict", static_cast<std::size_t>(1), r.conflicts.size());
    ASSERT_EQ("kind AUTHORITY", ConflictKind::Authority, r.conflicts[0].kind);
    ASSERT_EQ("winner A", std::string("A"), r.conflicts[0].winning_rule_id);
    ASSERT_EQ("strategy", std::string("Authority Precedence"), r.conflicts[0].resolution_strategy);
    ASSERT_TRUE("reason names tiers",
                r.conflicts[0].reason.find("L1_National supersedes L3_University") != std::string::npos);

    auto ids = r.conflicts[0].conflicting_rule_ids();
    ASSERT_EQ("two parties", static_cast<std::size_t>(2), ids.size());
    ASSERT_EQ("winner listed first", std::string("A"), ids[0]);
    ASSERT_EQ("loser listed second", std::string("B"), ids[1]);
}

void test_salience_conflict() {
    std::cout << "\n[SalienceConflict]\n";
    ConflictResolver resolver;
    auto r = resolver.resolve({
        fired("A", L1, 1500, "2018-07-18", Outcome::Reject),
        fired("C", L1, 1600, "2010-01-01", Outcome::Accept),
    });
    ASSERT_EQ("outcome ACCEPT", Outcome::Accept, r.decision.outcome);
    ASSERT_EQ("salience 1600", 1600, r.decision.salience);
    ASSERT_EQ("rule C", std::string("C"), r.decision.applicable_rule_id);
    ASSERT_EQ("one conflict", static_cast<std::size_t>(1), r.conflicts.size());
    ASSERT_EQ("kind SALIENCE", ConflictKind::Salience, r.conflicts[0].kind);
    ASSERT_EQ("winner C", std::string("C"), r.conflicts[0].winning_rule_id);
    ASSERT_EQ("strategy", std::string("Salience-Based Priority"), r.conflicts[0].resolution_strategy);
}

void test_temporal_conflict() {
    std::cout << "\n[TemporalConflict]\n";
    ConflictResolver resolver;
    auto r = resolver.resolve({
        fired("Old", L3, 1000, "2019-01-01", Outcome::Reject),
        fired("New", L3, 1000, "2023-04-01", Outcome::Accept),
    });
    ASSERT_EQ("newer wins", std::string("New"), r.decision.applicable_rule_id);
    ASSERT_EQ("kind TEMPORAL", ConflictKind::Temporal, r.conflicts[0].kind);
    ASSERT_EQ("strategy", std::string("Temporal Precedence"), r.conflicts[0].resolution_strategy);

    auto undated = resolver.resolve({
        fired("Aaa", L3, 1000, nullptr,      Outcome::Reject),
        fired("Zzz", L3, 1000, "2000-01-01", Outcome::Accept),
    });
    ASSERT_EQ("dated rule beats undated rule", std::string("Zzz"), undated.decision.applicable_rule_id);
    ASSERT_EQ("classified TEMPORAL", ConflictKind::Temporal, undated.conflicts[0].kind);
}

void test_deterministic_tiebreak() {
    std::cout << "\n[DeterministicTiebreak]\n";
    ConflictResolver resolver;
    auto r = resolver.resolve({
        fired("Rule_B", L2, 700, "2020-01-01", Outcome::Accept),
        fired("Rule_A", L2, 700, "2020-01-01", Outcome::Reject),
    });
    ASSERT_EQ("lower id wins", std::string("Rule_A"), r.decision.applicable_rule_id);
    ASSERT_EQ("one conflict", static_cast<std::size_t>(1), r.conflicts.size());
    ASSERT_EQ("kind UNDETERMINED", ConflictKind::Undetermined, r.conflicts[0].kind);
    ASSERT_EQ("strategy", std::string("Deterministic Tiebreak (rule conflict)"),
              r.conflicts[0].resolution_strategy);

    auto both_undated = resolver.resolve({
        fired("Y", L3, 100, nullptr, Outcome::Accept),
        fired("X", L3, 100, nullptr, Outcome::Reject),
    });
    ASSERT_EQ("undated tie falls back to id", std::string("X"), both_undated.decision.applicable_rule_id);
}

void test_tiebreak_totality() {
    std::cout << "\n[TiebreakTotality]\n";
    ConflictResolver resolver;

    auto tier_first = resolver.resolve({
        fired("Low",  L3, 9999, "2025-01-01", Outcome::Accept),
        fired("High", L1, 1,    "1990-01-01", Outcome::Reject),
    });
    ASSERT_EQ("L1 beats L3 despite salience and date", std::string("High"),
              tier_first.decision.applicable_rule_id);

    auto salience_second = resolver.resolve({
        fired("Recent", L2, 100, "2025-01-01", Outcome::Accept),
        fired("Strong", L2, 200, "1990-01-01", Outcome::Reject),
    });
    ASSERT_EQ("salience beats date", std::string("Strong"),
              salience_second.decision.applicable_rule_id);

    Firing a = fired("a", L2, 5, "2020-01-01", Outcome::Accept);
    Firing b = fired("b", L2, 5, "2020-01-01", Outcome::Accept);
    ASSERT_TRUE("a precedes b", takes_precedence(a, b));
    ASSERT_TRUE("b does not precede a", !takes_precedence(b, a));
    ASSERT_TRUE("irreflexive", !takes_precedence(a, a));
}

void test_agreement_is_not_conflict() {
    std::cout << "\n[AgreementIsNotConflict]\n";
    ConflictResolver resolver;
    auto r = resolver.resolve({
        fired("Uni_Reject", L3, 800,  "2022-01-01", Outcome::Reject),
        fired("UGC_Reject", L1, 1500, "2018-07-18", Outcome::Reject),
    });
    ASSERT_TRUE("no conflicts", r.conflicts.empty());
    ASSERT_EQ("outcome REJECT", Outcome::Reject, r.decision.outcome);
    ASSERT_EQ("attributed to L1 rule", std::string("UGC_Reject"), r.decision.applicable_rule_id);

    auto three = resolver.resolve({
        fired("x", L2, 10, nullptr, Outcome::Accept),
        fired("y", L3, 90, nullptr, Outcome::Accept),
        fired("z", L2, 20, nullptr, Outcome::Accept),
    });
    ASSERT_TRUE("three agreeing -> no conflicts", three.conflicts.empty());
    ASSERT_EQ("highest tier then salience", std::string("z"), three.decision.applicable_rule_id);
}

void test_pairwise_conflicts() {
    std::cout << "\n[PairwiseConflicts]\n";
    ConflictResolver resolver;
    auto r = resolver.resolve({
        fired("A", L2, 100, nullptr, Outcome::Reject),
        fired("B", L2, 200, nullptr, Outcome::Accept),
        fired("C", L1, 50,  nullptr, Outcome::Accept),
    });
    ASSERT_EQ("two disagreeing pairs", static_cast<std::size_t>(2), r.conflicts.size());
    ASSERT_EQ("A vs B is salience", ConflictKind::Salience, r.conflicts[0].kind);
    ASSERT_EQ("A vs B won by B", std::string("B"), r.conflicts[0].winning_rule_id);
    ASSERT_EQ("A vs C is authority", ConflictKind::Authority, r.conflicts[1].kind);
    ASSERT_EQ("A vs C won by C", std::string("C"), r.conflicts[1].winning_rule_id);
    ASSERT_EQ("global winner C", std::string("C"), r.decision.applicable_rule_id);
    ASSERT_EQ("global outcome ACCEPT", Outcome::Accept, r.decision.outcome);
}

void test_human_review_overlay() {
    std::cout << "\n[HumanReviewOverlay]\n";
    ConflictResolver resolver;
    std::vector<Firing> firings = {
        fired("A", L1, 1500, nullptr, Outcome::Reject),
        fired("B", L3, 500,  nullptr, Outcome::Accept),
    };

    auto plain = resolver.resolve(firings, false);
    auto flagged = resolver.resolve(firings, true);
    ASSERT_TRUE("no review without flag", !plain.decision.human_review_required);
    ASSERT_TRUE("review with flag", flagged.decision.human_review_required);
    ASSERT_EQ("flag keeps outcome", plain.decision.outcome, flagged.decision.outcome);
    ASSERT_EQ("flag keeps rule", plain.decision.applicable_rule_id, flagged.decision.applicable_rule_id);
    ASSERT_EQ("flag keeps conflicts", plain.conflicts.size(), flagged.conflicts.size());

    auto from_template = resolver.resolve({ fired("R", L2, 1, nullptr, Outcome::PartialAccept, true) });
    ASSERT_TRUE("template review flag carried", from_template.decision.human_review_required);
}

void test_deterministic_output() {
    std::cout << "\n[DeterministicOutput]\n";
    ConflictResolver resolver;
    std::vector<Firing> firings = {
        fired("A", L1, 1500, "2018-07-18", Outcome::Reject),
        fired("B", L3, 500,  "2021-06-01", Outcome::Accept),
        fired("C", L1, 1600, "2020-01-01", Outcome::Accept),
    };
    auto first  = resolver.resolve(firings);
    auto second = resolver.resolve(firings);
    bool same = first.conflicts.size() == second.conflicts.size() &&
                first.decision.applicable_rule_id == second.decision.applicable_rule_id;
    for (std::size_t i = 0; same && i < first.conflicts.size(); ++i) {
        same = first.conflicts[i].winning_rule_id == second.conflicts[i].winning_rule_id &&
               first.conflicts[i].reason == second.conflicts[i].reason;
    }
    ASSERT_TRUE("repeated resolution identical", same);
}

void test_enum_text() {
    std::cout << "\n[EnumText]\n";
    ASSERT_EQ("authority text", std::string("AUTHORITY_CONFLICT"), to_string(ConflictKind::Authority));
    ASSERT_EQ("parse temporal", ConflictKind::Temporal, parse_conflict_kind("TEMPORAL_CONFLICT"));
    ASSERT_EQ("tier text", std::string("L2_Accreditation"), to_string(L2));
    ASSERT_EQ("parse outcome", Outcome::PartialAccept, parse_outcome("PARTIAL_ACCEPT"));

    bool threw = false;
    try {
        parse_tier("L4_Department");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE("unknown tier rejected", threw);
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Conflict Resolver Tests ===\n";

    test_no_match();
    test_single_rule();
    test_authority_conflict();
    test_salience_conflict();
    test_temporal_conflict();
    test_deterministic_tiebreak();
    test_tiebreak_totality();
    test_agreement_is_not_conflict();
    test_pairwise_conflicts();
    test_human_review_overlay();
    test_deterministic_output();
    test_enum_text();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
