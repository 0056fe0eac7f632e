#pragma once

#include "grievance/rule.hpp"

#include <stdexcept>
#include <string>

namespace grievance {

/// Raised for any malformed rule document. `where` names the file and/or rule id.
class RuleLoadError : public std::runtime_error {
public:
    RuleLoadError(std::string where, std::string message);

    const std::string& where() const { return where_; }
    const std::string& message() const { return message_; }

    /// "rule error [<where>]: <message>"
    std::string format() const;

private:
    std::string where_;
    std::string message_;
};

/**
 * Parses a YAML rule-definition document into a RuleSet.
 *
 *   rules:
 *     - id: UGC_Attendance_75Percent_Minimum
 *       tier: L1_National
 *       salience: 1500
 *       effective_date: 2018-07-18          # optional
 *       grievance_type: ATTENDANCE_SHORTAGE
 *       conditions:
 *         - { field: attendance_percentage, op: "<", value: 75 }
 *         - { field: student_category, op: in, values: [SC, ST] }
 *       outcome:
 *         decision: REJECT
 *         reason: "Attendance {attendance_percentage}% is below 75%"
 *         regulatory_source: "UGC Regulations 2018, Section 4.2"
 *         action_required: ""               # optional
 *         human_review_required: false      # optional
 *       metadata: { title: ..., authority: UGC, category: Attendance, description: ... }
 *
 * Quoted scalars are strings. Unquoted YAML booleans (`true`, `True`,
 * `FALSE`, `yes`, `off`, ...) are booleans and unquoted numerals are numbers.
 */
RuleSet load_rules(const std::string& yaml_text);
RuleSet load_rules_file(const std::string& path);

} // namespace grievance
