#include "grievance/engine.hpp"
#include "grievance/json.hpp"
#include "grievance/rule_loader.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace grievance;

// ── Helpers ──────────────────────────────────────────────────────────────────

static GrievanceFacts attendance_with_certificate() {
    return { "GRV-001", "ATTENDANCE_SHORTAGE",
             { {"attendance_percentage", 68.5}, {"has_medical_certificate", true} } };
}

/// JSON of an adjudication with the wall-clock duration zeroed.
static std::string stable_json(Adjudication a) {
    a.trace.processing_duration_ms = 0;
    return to_json(a);
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

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

void test_national_minimum_overrides_medical_excuse() {
    std::cout << "\n[NationalMinimumOverridesMedicalExcuse]\n";
    GrievanceEngine engine;
    auto result = engine.adjudicate(attendance_with_certificate(), default_rule_set());
    const auto& d = result.decision();

    ASSERT_EQ("outcome", Outcome::Reject, d.outcome);
    ASSERT_EQ("rule", std::string("UGC_Attendance_75Percent_Minimum"), d.applicable_rule_id);
    ASSERT_EQ("tier", AuthorityTier::L1_National, d.tier);
    ASSERT_EQ("rendered reason",
              std::string("Attendance 68.5% is below UGC-mandated 75% minimum"), d.reason);
    ASSERT_TRUE("no review", !d.human_review_required);

    ASSERT_EQ("every rule traced", static_cast<std::size_t>(11), result.trace.firings.size());
    ASSERT_EQ("two fired", static_cast<std::size_t>(2), result.trace.fired_count());
    ASSERT_EQ("one conflict", static_cast<std::size_t>(1), result.trace.conflicts.size());
    if (!result.trace.conflicts.empty()) {
        const auto& c = result.trace.conflicts.front();
        ASSERT_EQ("authority conflict", ConflictKind::Authority, c.kind);
        ASSERT_EQ("winner", std::string("UGC_Attendance_75Percent_Minimum"), c.winning_rule_id);
        ASSERT_EQ("strategy", std::string("Authority Precedence"), c.resolution_strategy);
    }
    ASSERT_EQ("explanation count", static_cast<std::size_t>(1), result.explanation.conflicts_count);
    ASSERT_TRUE("narrative names loser",
                contains(result.explanation.narrative, "University_Medical_Excuse_Attendance"));
}

void test_grievance_kinds() {
    std::cout << "\n[GrievanceKinds]\n";
    GrievanceEngine engine;
    auto rules = default_rule_set();

    auto lab = engine.adjudicate({ "GRV-002", "ATTENDANCE_SHORTAGE",
                                   { {"attendance_percentage", 82.0}, {"is_technical_course", true},
                                     {"lab_attendance_percentage", 70.0} } }, rules);
    ASSERT_EQ("national satisfaction outranks accreditation",
              std::string("UGC_Attendance_Satisfied"), lab.decision().applicable_rule_id);
    ASSERT_EQ("lab outcome", Outcome::Accept, lab.decision().outcome);

    auto unpaid = engine.adjudicate({ "GRV-003", "EXAMINATION_REEVAL",
                                      { {"days_since_result_declaration", 10.0},
                                        {"revaluation_fee_paid", false} } }, rules);
    ASSERT_EQ("fee pending", Outcome::PendingClarification, unpaid.decision().outcome);
    ASSERT_EQ("fee action", std::string("Pay revaluation fee"), unpaid.decision().action_required);
    ASSERT_TRUE("no conflicts", unpaid.trace.conflicts.empty());

    auto late = engine.adjudicate({ "GRV-004", "EXAMINATION_REEVAL",
                                    { {"days_since_result_declaration", 21.0},
                                      {"revaluation_fee_paid", true} } }, rules);
    ASSERT_EQ("late request", std::string("University_Revaluation_Deadline"),
              late.decision().applicable_rule_id);
    ASSERT_EQ("late outcome", Outcome::Reject, late.decision().outcome);

    auto ews = engine.adjudicate({ "GRV-005", "FEE_WAIVER",
                                   { {"student_category", text_value("EWS")},
                                     {"family_income", 450000.0},
                                     {"has_income_certificate", true} } }, rules);
    ASSERT_EQ("ews waiver", std::string("National_EWS_Fee_Waiver"), ews.decision().applicable_rule_id);
    ASSERT_EQ("ews outcome", Outcome::Accept, ews.decision().outcome);
}

void test_unknown_type_goes_to_review() {
    std::cout << "\n[UnknownTypeGoesToReview]\n";
    GrievanceEngine engine;
    auto result = engine.adjudicate({ "GRV-006", "TRANSCRIPT_DELAY", {} }, default_rule_set());
    const auto& d = result.decision();

    ASSERT_EQ("pending", Outcome::PendingClarification, d.outcome);
    ASSERT_EQ("default rule", std::string("Default_Review_Required"), d.applicable_rule_id);
    ASSERT_EQ("university tier", AuthorityTier::L3_University, d.tier);
    ASSERT_EQ("reason", std::string("No applicable rule matched"), d.reason);
    ASSERT_EQ("action", std::string("Provide additional details"), d.action_required);
    ASSERT_TRUE("review required", d.human_review_required);
    ASSERT_EQ("nothing fired", static_cast<std::size_t>(0), result.trace.fired_count());
}

void test_determinism_and_rule_order() {
    std::cout << "\n[DeterminismAndRuleOrder]\n";
    GrievanceEngine engine;
    auto rules = default_rule_set();
    auto facts = attendance_with_certificate();

    auto first  = stable_json(engine.adjudicate(facts, rules));
    auto second = stable_json(engine.adjudicate(facts, rules));
    ASSERT_EQ("repeat runs identical", first, second);

    std::vector<Rule> reversed = rules.rules();
    std::reverse(reversed.begin(), reversed.end());
    ASSERT_EQ("supply order does not matter", first, stable_json(engine.adjudicate(facts, reversed)));
}

void test_ambiguity_flag() {
    std::cout << "\n[AmbiguityFlag]\n";
    GrievanceEngine engine;
    auto rules = default_rule_set();
    auto facts = attendance_with_certificate();

    auto plain   = engine.adjudicate(facts, rules);
    auto flagged = engine.adjudicate(facts, rules, true);
    ASSERT_TRUE("review forced", flagged.decision().human_review_required);
    ASSERT_EQ("outcome unchanged", plain.decision().outcome, flagged.decision().outcome);
    ASSERT_EQ("rule unchanged", plain.decision().applicable_rule_id,
              flagged.decision().applicable_rule_id);
    ASSERT_TRUE("context reflects review",
                contains(flagged.explanation.final_decision_context, "Human Review Required:** Yes"));
}

void test_loaded_rules_match_builtin() {
    std::cout << "\n[LoadedRulesMatchBuiltin]\n";
    GrievanceEngine engine;
    auto loaded  = load_rules_file(GRIEVANCE_SOURCE_DIR "/rules/academic_rules.yaml");
    auto builtin = default_rule_set();

    std::vector<GrievanceFacts> samples = {
        attendance_with_certificate(),
        { "GRV-007", "ATTENDANCE_SHORTAGE", { {"attendance_percentage", 60.0} } },
        { "GRV-008", "FEE_WAIVER", { {"student_category", text_value("SC")} } },
        { "GRV-009", "FEE_WAIVER", { {"student_category", text_value("EWS")},
                                     {"has_income_certificate", false} } },
        { "GRV-010", "EXAMINATION_REEVAL", { {"days_since_result_declaration", 15.0},
                                             {"revaluation_fee_paid", true} } },
    };

    bool same = true;
    for (const auto& facts : samples) {
        auto a = engine.adjudicate(facts, loaded);
        auto b = engine.adjudicate(facts, builtin);
        same = same &&
               a.decision().outcome == b.decision().outcome &&
               a.decision().applicable_rule_id == b.decision().applicable_rule_id &&
               a.decision().reason == b.decision().reason &&
               a.trace.conflicts.size() == b.trace.conflicts.size();
    }
    ASSERT_TRUE("same decisions from the rules file and the default rules", same);
}

void test_assess() {
    std::cout << "\n[Assess]\n";
    EngineConfig config;
    config.consistency_threshold = 0.8;
    config.review_band_upper     = 0.8;
    GrievanceEngine engine(config);
    ASSERT_EQ("config kept", 0.8, engine.config().consistency_threshold);

    auto result = engine.adjudicate(attendance_with_certificate(), default_rule_set());
    std::vector<SimilarCase> prior = {
        { "GRV-0901", Outcome::Reject, "UGC_Attendance_75Percent_Minimum", AuthorityTier::L1_National },
        { "GRV-0932", Outcome::Accept, "University_Medical_Excuse_Attendance", AuthorityTier::L3_University },
    };
    auto report = engine.assess(result.decision(), prior);
    // 0.5 * 0.5 + 0.3 * 0.5 + 0.2 * 0.5
    ASSERT_EQ("score", 0.5, report.consistency_score);
    ASSERT_EQ("threshold from config", 0.8, report.threshold);
    ASSERT_TRUE("below threshold", !report.meets_threshold);
    // REJECT is the first-seen majority, so no anomaly.
    ASSERT_TRUE("no anomaly", !report.anomaly_detected);
    ASSERT_EQ("review suggested", Recommendation::ReviewSuggested, report.recommendation);
}

void test_json_and_logging() {
    std::cout << "\n[JsonAndLogging]\n";
    std::ostringstream sink;
    Logger logger(sink, LogLevel::Debug);
    GrievanceEngine engine(EngineConfig{}, &logger);

    auto json = to_json(engine.adjudicate(attendance_with_certificate(), default_rule_set()));
    ASSERT_TRUE("trace section", contains(json, "\"trace\": {"));
    ASSERT_TRUE("explanation section", contains(json, "\"explanation\": {"));
    ASSERT_TRUE("final decision", contains(json, "\"outcome\": \"REJECT\""));
    ASSERT_TRUE("conflict type", contains(json, "\"AUTHORITY_CONFLICT\""));
    ASSERT_TRUE("no action is null", contains(json, "\"action_required\": null"));

    const auto log = sink.str();
    ASSERT_TRUE("engine logs start", contains(log, "[INFO] engine: evaluating grievance 'GRV-001'"));
    ASSERT_TRUE("engine logs decision", contains(log, "-> REJECT <- UGC_Attendance_75Percent_Minimum"));

    std::ostringstream quiet_sink;
    Logger quiet(quiet_sink, LogLevel::Off);
    GrievanceEngine silent(EngineConfig{}, &quiet);
    silent.adjudicate(attendance_with_certificate(), default_rule_set());
    ASSERT_TRUE("off level writes nothing", quiet_sink.str().empty());
}

void test_concurrent_adjudication() {
    std::cout << "\n[ConcurrentAdjudication]\n";
    std::ostringstream sink;
    Logger logger(sink, LogLevel::Info);
    const GrievanceEngine engine(EngineConfig{}, &logger);
    const auto rules = default_rule_set();
    const auto expected = stable_json(engine.adjudicate(attendance_with_certificate(), rules));

    std::vector<std::string> results(4);
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < results.size(); ++i) {
        workers.emplace_back([&, i] {
            results[i] = stable_json(engine.adjudicate(attendance_with_certificate(), rules));
        });
    }
    for (auto& w : workers) w.join();

    bool same = std::all_of(results.begin(), results.end(),
                            [&](const std::string& r) { return r == expected; });
    ASSERT_TRUE("shared engine gives identical results", same);
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Engine Tests ===\n";

    test_national_minimum_overrides_medical_excuse();
    test_grievance_kinds();
    test_unknown_type_goes_to_review();
    test_determinism_and_rule_order();
    test_ambiguity_flag();
    test_loaded_rules_match_builtin();
    test_assess();
    test_json_and_logging();
    test_concurrent_adjudication();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
