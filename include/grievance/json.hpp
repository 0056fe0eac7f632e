#pragma once

#include "grievance/engine.hpp"
#include "grievance/fairness.hpp"
#include "grievance/trace.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace grievance {

namespace json_detail {

inline std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream hex;
                    hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    result += hex.str();
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

inline std::string quoted(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

inline std::string boolean(bool b) {
    return b ? "true" : "false";
}

inline std::string value(const std::optional<ParamValue>& v) {
    if (!v) return "null";
    if (std::holds_alternative<std::string>(*v)) return quoted(std::get<std::string>(*v));
    return to_string(*v);
}

inline std::string optional_string(const std::string& s) {
    return s.empty() ? std::string("null") : quoted(s);
}

inline std::string number(double d) {
    std::ostringstream os;
    os << std::setprecision(10) << d;
    return os.str();
}

} // namespace json_detail

inline std::string to_json(const Decision& d) {
    std::ostringstream os;
    os << "{ \"outcome\": "               << json_detail::quoted(to_string(d.outcome))
       << ", \"applicable_rule\": "       << json_detail::quoted(d.applicable_rule_id)
       << ", \"hierarchy_level\": "       << json_detail::quoted(to_string(d.tier))
       << ", \"salience\": "              << d.salience
       << ", \"reason\": "                << json_detail::quoted(d.reason)
       << ", \"regulatory_source\": "     << json_detail::quoted(d.regulatory_source)
       << ", \"action_required\": "       << json_detail::optional_string(d.action_required)
       << ", \"human_review_required\": " << json_detail::boolean(d.human_review_required)
       << " }";
    return os.str();
}

inline std::string to_json(const ConditionCheck& c) {
    std::ostringstream os;
    os << "{ \"condition\": "  << json_detail::quoted(c.expression)
       << ", \"satisfied\": "  << json_detail::boolean(c.satisfied)
       << ", \"value\": "      << json_detail::value(c.observed)
       << " }";
    return os.str();
}

inline std::string to_json(const Firing& f) {
    std::ostringstream os;
    os << "{ \"rule_id\": "         << json_detail::quoted(f.rule_id)
       << ", \"hierarchy_level\": " << json_detail::quoted(to_string(f.tier))
       << ", \"salience\": "        << f.salience
       << ", \"effective_date\": "
       << (f.effective_date ? json_detail::quoted(to_string(*f.effective_date)) : std::string("null"))
       << ", \"fired\": "           << json_detail::boolean(f.fired)
       << ", \"conditions_checked\": [";
    for (std::size_t i = 0; i < f.conditions_checked.size(); ++i) {
        if (i > 0) os << ", ";
        os << to_json(f.conditions_checked[i]);
    }
    os << "]";
    if (f.outcome) {
        os << ", \"outcome\": " << json_detail::quoted(to_string(f.outcome->outcome))
           << ", \"reason\": "  << json_detail::quoted(f.outcome->reason)
           << ", \"source\": "  << json_detail::quoted(f.outcome->regulatory_source);
    } else {
        os << ", \"outcome\": null";
    }
    os << " }";
    return os.str();
}

inline std::string to_json(const Conflict& c) {
    std::ostringstream os;
    os << "{ \"type\": " << json_detail::quoted(to_string(c.kind))
       << ", \"conflicting_rules\": [";
    for (std::size_t i = 0; i < c.parties.size(); ++i) {
        if (i > 0) os << ", ";
        os << json_detail::quoted(c.parties[i].rule_id + " (" + to_string(c.parties[i].tier) + ")");
    }
    os << "], \"resolution_strategy\": " << json_detail::quoted(c.resolution_strategy)
       << ", \"winning_rule\": "         << json_detail::quoted(c.winning_rule_id)
       << ", \"reason\": "               << json_detail::quoted(c.reason)
       << " }";
    return os.str();
}

inline std::string to_json(const Trace& t) {
    std::ostringstream os;
    os << "{\n"
       << "  \"grievance_id\": " << json_detail::quoted(t.grievance_id) << ",\n"
       << "  \"rules_evaluated\": [";
    for (std::size_t i = 0; i < t.firings.size(); ++i) {
        os << "\n    " << to_json(t.firings[i]);
        if (i + 1 < t.firings.size()) os << ",";
    }
    os << "\n  ],\n"
       << "  \"conflicts_detected\": [";
    for (std::size_t i = 0; i < t.conflicts.size(); ++i) {
        os << "\n    " << to_json(t.conflicts[i]);
        if (i + 1 < t.conflicts.size()) os << ",";
    }
    os << "\n  ],\n"
       << "  \"final_decision\": " << to_json(t.decision) << ",\n"
       << "  \"processing_time_ms\": " << t.processing_duration_ms << "\n"
       << "}";
    return os.str();
}

inline std::string to_json(const Explanation& e) {
    std::ostringstream os;
    os << "{\n"
       << "  \"summary\": "                << json_detail::quoted(e.summary) << ",\n"
       << "  \"explanation\": "            << json_detail::quoted(e.narrative) << ",\n"
       << "  \"final_decision_context\": " << json_detail::quoted(e.final_decision_context) << ",\n"
       << "  \"resolution_strategy\": "    << json_detail::quoted(e.resolution_strategy) << ",\n"
       << "  \"conflicts_count\": "        << e.conflicts_count << "\n"
       << "}";
    return os.str();
}

inline std::string to_json(const SimilarCase& c) {
    std::ostringstream os;
    os << "{ \"grievance_id\": "    << json_detail::quoted(c.case_id)
       << ", \"outcome\": "         << json_detail::quoted(to_string(c.outcome))
       << ", \"applicable_rule\": " << json_detail::quoted(c.applicable_rule_id)
       << ", \"hierarchy_level\": " << json_detail::quoted(to_string(c.tier))
       << " }";
    return os.str();
}

inline std::string to_json(const FairnessReport& r) {
    std::ostringstream os;
    os << "{\n"
       << "  \"consistency_score\": "     << json_detail::number(r.consistency_score) << ",\n"
       << "  \"consistency_threshold\": " << json_detail::number(r.threshold) << ",\n"
       << "  \"meets_threshold\": "       << json_detail::boolean(r.meets_threshold) << ",\n"
       << "  \"anomaly_detected\": "      << json_detail::boolean(r.anomaly_detected) << ",\n"
       << "  \"anomaly_reason\": "
       << (r.anomaly_reason ? json_detail::quoted(*r.anomaly_reason) : std::string("null")) << ",\n"
       << "  \"similar_cases_count\": "   << r.similar_cases_considered << ",\n"
       << "  \"similar_cases\": [";
    for (std::size_t i = 0; i < r.similar_cases_preview.size(); ++i) {
        os << "\n    " << to_json(r.similar_cases_preview[i]);
        if (i + 1 < r.similar_cases_preview.size()) os << ",";
    }
    os << "\n  ],\n"
       << "  \"recommendation\": " << json_detail::quoted(to_string(r.recommendation)) << ",\n"
       << "  \"message\": "        << json_detail::quoted(r.message) << "\n"
       << "}";
    return os.str();
}

inline std::string to_json(const Adjudication& a) {
    std::ostringstream os;
    os << "{\n"
       << "  \"trace\": "       << to_json(a.trace) << ",\n"
       << "  \"explanation\": " << to_json(a.explanation) << "\n"
       << "}";
    return os.str();
}

} // namespace grievance
