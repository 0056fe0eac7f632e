#include "grievance/config.hpp"
#include "grievance/engine.hpp"
#include "grievance/json.hpp"
#include "grievance/log.hpp"
#include "grievance/rule_loader.hpp"

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace grievance;

static std::string outcome_tag(Outcome o) {
    switch (o) {
        case Outcome::Accept:               return "[ACCEPT] ";
        case Outcome::Reject:               return "[REJECT] ";
        case Outcome::PartialAccept:        return "[PARTIAL]";
        case Outcome::PendingClarification: return "[PENDING]";
        default:                            return "[?]      ";
    }
}

static void print_decision(const GrievanceFacts& facts, const Decision& d) {
    std::cout << "\n  Grievance : " << facts.id << " [" << facts.type << "]\n"
              << "  Decision  : " << outcome_tag(d.outcome)
              << " <- " << d.applicable_rule_id << " (" << d.tier << ", salience " << d.salience << ")\n"
              << "  Reason    : " << d.reason << "\n"
              << "  Source    : " << d.regulatory_source << "\n";
    if (!d.action_required.empty())
        std::cout << "  Action    : " << d.action_required << "\n";
    if (d.human_review_required)
        std::cout << "  Review    : human review required\n";
}

static void print_trace(const Trace& trace) {
    std::cout << "  Rules (" << trace.fired_count() << " fired, "
              << trace.not_fired_count() << " not fired):\n";
    for (const auto& f : trace.firings) {
        std::cout << "    [" << (f.fired ? "FIRED  " : "skipped") << "] " << f.rule_id;
        if (f.outcome) std::cout << " -> " << f.outcome->outcome;
        std::cout << "\n";
        for (const auto& c : f.conditions_checked) {
            std::cout << "        " << (c.satisfied ? "+ " : "- ") << c.expression;
            if (c.observed) std::cout << "  (observed: " << to_string(*c.observed) << ")";
            else            std::cout << "  (observed: absent)";
            std::cout << "\n";
        }
    }
    std::cout << "  Conflicts : " << conflict_summary(trace.conflicts) << "\n";
}

static void separator(const std::string& title) {
    std::cout << "\n" << std::string(55, '-') << "\n"
              << "  " << title << "\n"
              << std::string(55, '-') << "\n";
}

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--rules FILE] [--config FILE]\n";
}

int main(int argc, char** argv) {
    std::string rules_path;
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--rules") == 0 && i + 1 < argc) {
            rules_path = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    // ── Load configuration and rules ─────────────────────────────────────────
    EngineConfig config;
    RuleSet rules;
    try {
        if (!config_path.empty()) config = load_config_file(config_path);
        rules = rules_path.empty() ? default_rule_set() : load_rules_file(rules_path);
    } catch (const ConfigError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    } catch (const RuleLoadError& e) {
        std::cerr << "error: " << e.format() << "\n";
        return 1;
    }

    Logger logger(std::clog, config.log_level);
    GrievanceEngine engine(config, &logger);

    // ── Sample grievances ────────────────────────────────────────────────────
    std::vector<GrievanceFacts> grievances = {
        { "GRV-001", "ATTENDANCE_SHORTAGE",
          { {"attendance_percentage", 68.5}, {"has_medical_certificate", true} } },
        { "GRV-002", "ATTENDANCE_SHORTAGE",
          { {"attendance_percentage", 82.0}, {"is_technical_course", true},
            {"lab_attendance_percentage", 70.0} } },
        { "GRV-003", "EXAMINATION_REEVAL",
          { {"days_since_result_declaration", 10.0}, {"revaluation_fee_paid", false} } },
        { "GRV-004", "EXAMINATION_REEVAL",
          { {"days_since_result_declaration", 21.0}, {"revaluation_fee_paid", true} } },
        { "GRV-005", "FEE_WAIVER",
          { {"student_category", text_value("EWS")}, {"family_income", 450000.0},
            {"has_income_certificate", true} } },
        { "GRV-006", "TRANSCRIPT_DELAY", {} },
    };

    separator("GRIEVANCE ADJUDICATION");

    std::vector<Adjudication> results;
    for (const auto& g : grievances) {
        auto result = engine.adjudicate(g, rules);
        print_decision(g, result.decision());
        results.push_back(std::move(result));
    }

    // ── Conflict resolution trace ────────────────────────────────────────────
    separator("EVALUATION TRACE");

    std::cout << "\n  Grievance : " << grievances[0].id << "\n";
    print_trace(results[0].trace);
    std::cout << "\n" << results[0].explanation.narrative << "\n\n"
              << results[0].explanation.final_decision_context << "\n";

    // ── Ambiguity overlay ────────────────────────────────────────────────────
    separator("AMBIGUITY OVERLAY");

    {
        auto flagged = engine.adjudicate(grievances[3], rules, true);
        print_decision(grievances[3], flagged.decision());
    }

    // ── Fairness ─────────────────────────────────────────────────────────────
    separator("FAIRNESS");

    std::vector<SimilarCase> prior = {
        { "GRV-0901", Outcome::Reject, "UGC_Attendance_75Percent_Minimum", AuthorityTier::L1_National },
        { "GRV-0914", Outcome::Reject, "UGC_Attendance_75Percent_Minimum", AuthorityTier::L1_National },
        { "GRV-0932", Outcome::Accept, "University_Medical_Excuse_Attendance", AuthorityTier::L3_University },
        { "GRV-0957", Outcome::Reject, "UGC_Attendance_75Percent_Minimum", AuthorityTier::L1_National },
    };

    std::vector<FairnessReport> reports;
    for (std::size_t i = 0; i < 2; ++i) {
        auto report = engine.assess(results[i].decision(), prior);
        std::cout << "\n  Grievance : " << grievances[i].id << "\n"
                  << "  Score     : " << report.consistency_score
                  << (report.meets_threshold ? " (meets threshold)" : " (below threshold)") << "\n"
                  << "  Verdict   : " << report.recommendation << "\n";
        if (report.anomaly_reason)
            std::cout << "  Anomaly   : " << *report.anomaly_reason << "\n";
        reports.push_back(std::move(report));
    }

    auto metrics = summarize(reports);
    std::cout << "\n  Checks: " << metrics.total_checks
              << ", average score: " << metrics.average_score
              << ", anomaly rate: " << metrics.anomaly_rate << "\n";

    // ── JSON Output ──────────────────────────────────────────────────────────
    separator("JSON OUTPUT");

    std::cout << "\n  Adjudication:\n" << to_json(results[0]) << "\n";
    std::cout << "\n  FairnessReport:\n" << to_json(reports[0]) << "\n";

    std::cout << "\n" << std::string(55, '-') << "\n"
              << "  Adjudication complete.\n"
              << std::string(55, '-') << "\n\n";
    return 0;
}
