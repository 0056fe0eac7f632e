#pragma once

#include "grievance/config.hpp"
#include "grievance/log.hpp"
#include "grievance/resolver.hpp"
#include "grievance/types.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace grievance {

enum class Recommendation { HumanReviewRecommended, ReviewSuggested, Consistent };

std::string to_string(Recommendation r);   // "human review recommended", ...

inline std::ostream& operator<<(std::ostream& os, Recommendation r) { return os << to_string(r); }

/// Summary of a prior decision on a similar grievance, supplied by storage.
struct SimilarCase {
    std::string   case_id;
    Outcome       outcome = Outcome::PendingClarification;
    std::string   applicable_rule_id;
    AuthorityTier tier    = AuthorityTier::L3_University;
};

struct FairnessReport {
    double                     consistency_score   = 1.0;
    double                     threshold           = 0.85;
    bool                       meets_threshold     = true;
    double                     outcome_match_ratio = 1.0;
    double                     rule_match_ratio    = 1.0;
    double                     tier_match_ratio    = 1.0;
    bool                       anomaly_detected    = false;
    std::optional<std::string> anomaly_reason;
    std::size_t                similar_cases_considered = 0;
    std::vector<SimilarCase>   similar_cases_preview;
    Recommendation             recommendation      = Recommendation::Consistent;
    std::string                message;
};

struct FairnessMetrics {
    std::size_t total_checks       = 0;
    double      average_score      = 0.0;
    std::size_t anomalies_detected = 0;
    double      anomaly_rate       = 0.0;
};

/**
 * FairnessScorer
 *
 * Compares a decision with prior decisions on similar grievances.
 *
 *   score = w_outcome * outcome matches + w_rule * rule matches + w_tier * tier matches
 *
 * each term a fraction of the cases considered, rounded to 4 decimal places.
 * An anomaly needs both a score under the threshold and an outcome that
 * differs from the most frequent prior outcome (first seen wins ties).
 * With no prior cases the score is 1.0 and nothing is flagged.
 */
class FairnessScorer {
public:
    explicit FairnessScorer(EngineConfig config = {}, const Logger* logger = nullptr);

    FairnessReport score(const Decision& decision, const std::vector<SimilarCase>& similar_cases) const;

    const EngineConfig& config() const { return config_; }

private:
    Recommendation recommend(double score, bool anomaly) const;

    EngineConfig  config_;
    const Logger* logger_;
};

/// Aggregates reports collected by the caller; zero reports give all-zero metrics.
FairnessMetrics summarize(const std::vector<FairnessReport>& reports);

} // namespace grievance
