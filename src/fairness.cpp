#include "grievance/fairness.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace grievance {

namespace {

const char* kComponent = "fairness";

double round4(double value) {
    return std::round(value * 10000.0) / 10000.0;
}

std::string fixed(double value, int precision) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << value;
    return os.str();
}

/// Most frequent outcome and its count; the first outcome to reach the top count wins ties.
std::pair<Outcome, std::size_t> majority_outcome(const std::vector<SimilarCase>& cases) {
    std::vector<std::pair<Outcome, std::size_t>> counts;
    for (const auto& c : cases) {
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&](const auto& entry) { return entry.first == c.outcome; });
        if (it == counts.end()) {
            counts.emplace_back(c.outcome, 1);
        } else {
            ++it->second;
        }
    }

    auto best = counts.front();
    for (const auto& entry : counts)
        if (entry.second > best.second) best = entry;
    return best;
}

} // namespace

std::string to_string(Recommendation r) {
    switch (r) {
        case Recommendation::HumanReviewRecommended: return "human review recommended";
        case Recommendation::ReviewSuggested:        return "review suggested";
        case Recommendation::Consistent:             return "consistent";
    }
    return "unknown";
}

// ── FairnessScorer ────────────────────────────────────────────────────────────

FairnessScorer::FairnessScorer(EngineConfig config, const Logger* logger)
    : config_(std::move(config)), logger_(logger) {
    config_.validate();
}

FairnessReport FairnessScorer::score(const Decision& decision,
                                     const std::vector<SimilarCase>& similar_cases) const {
    FairnessReport report;
    report.threshold = config_.consistency_threshold;

    const std::size_t considered = std::min(similar_cases.size(), config_.similar_case_limit);
    const std::vector<SimilarCase> cases(similar_cases.begin(), similar_cases.begin() + considered);

    report.similar_cases_considered = cases.size();
    report.similar_cases_preview.assign(
        cases.begin(), cases.begin() + std::min(cases.size(), config_.preview_limit));

    if (cases.empty()) {
        if (logger_) logger_->warn(kComponent, "no similar cases supplied; consistency not penalised");
        report.consistency_score = 1.0;
        report.meets_threshold   = true;
        report.recommendation    = Recommendation::Consistent;
        report.message           = "CONSISTENT: No similar historical cases were available for comparison.";
        return report;
    }

    std::size_t outcome_matches = 0;
    std::size_t rule_matches    = 0;
    std::size_t tier_matches    = 0;
    for (const auto& c : cases) {
        if (c.outcome == decision.outcome)                       ++outcome_matches;
        if (c.applicable_rule_id == decision.applicable_rule_id) ++rule_matches;
        if (c.tier == decision.tier)                             ++tier_matches;
    }

    const double total = static_cast<double>(cases.size());
    report.outcome_match_ratio = outcome_matches / total;
    report.rule_match_ratio    = rule_matches / total;
    report.tier_match_ratio    = tier_matches / total;

    double score = config_.outcome_weight * report.outcome_match_ratio +
                   config_.rule_weight    * report.rule_match_ratio +
                   config_.tier_weight    * report.tier_match_ratio;
    report.consistency_score = std::clamp(round4(score), 0.0, 1.0);
    report.meets_threshold   = report.consistency_score >= config_.consistency_threshold;

    if (logger_) {
        logger_->info(kComponent, "consistency score " + fixed(report.consistency_score, 3) +
                      " (outcome " + fixed(report.outcome_match_ratio, 2) +
                      ", rule " + fixed(report.rule_match_ratio, 2) +
                      ", tier " + fixed(report.tier_match_ratio, 2) + ")");
    }

    if (!report.meets_threshold) {
        auto majority = majority_outcome(cases);
        if (decision.outcome != majority.first) {
            report.anomaly_detected = true;
            report.anomaly_reason =
                "Decision outcome '" + to_string(decision.outcome) +
                "' differs from most common outcome '" + to_string(majority.first) + "' (" +
                std::to_string(majority.second) + "/" + std::to_string(cases.size()) +
                " cases). Consistency score: " + fixed(report.consistency_score, 3) +
                " (threshold: " + fixed(config_.consistency_threshold, 2) + ")";
            if (logger_) logger_->warn(kComponent, "anomaly detected: " + *report.anomaly_reason);
        }
    }

    report.recommendation = recommend(report.consistency_score, report.anomaly_detected);
    switch (report.recommendation) {
        case Recommendation::HumanReviewRecommended:
            report.message = "HUMAN REVIEW RECOMMENDED: This decision shows significant deviation "
                             "from historical patterns. Please review for potential bias or "
                             "exceptional circumstances.";
            break;
        case Recommendation::ReviewSuggested:
            report.message = "REVIEW SUGGESTED: While within acceptable range, this decision shows "
                             "some variation from typical outcomes. Consider reviewing for consistency.";
            break;
        case Recommendation::Consistent:
            report.message = "CONSISTENT: This decision aligns well with historical patterns for "
                             "similar cases.";
            break;
    }
    return report;
}

Recommendation FairnessScorer::recommend(double score, bool anomaly) const {
    if (anomaly) return Recommendation::HumanReviewRecommended;
    if (score < config_.review_band_upper) return Recommendation::ReviewSuggested;
    return Recommendation::Consistent;
}

// ── Aggregates ────────────────────────────────────────────────────────────────

FairnessMetrics summarize(const std::vector<FairnessReport>& reports) {
    FairnessMetrics metrics;
    if (reports.empty()) return metrics;

    double sum = 0.0;
    for (const auto& r : reports) {
        sum += r.consistency_score;
        if (r.anomaly_detected) ++metrics.anomalies_detected;
    }
    metrics.total_checks  = reports.size();
    metrics.average_score = round4(sum / static_cast<double>(reports.size()));
    metrics.anomaly_rate  = round4(static_cast<double>(metrics.anomalies_detected) /
                                   static_cast<double>(reports.size()));
    return metrics;
}

} // namespace grievance
