#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>

namespace grievance {

// Total order: L1 > L2 > L3. Lower enumerator value means higher authority.
enum class AuthorityTier { L1_National = 1, L2_Accreditation = 2, L3_University = 3 };

enum class Outcome { Accept, Reject, PartialAccept, PendingClarification };

// ── Parameters ────────────────────────────────────────────────────────────────

using ParamValue = std::variant<bool, double, std::string>;
using Parameters = std::unordered_map<std::string, ParamValue>;

/// String literals must go through this: `ParamValue v = "SC"` selects bool on
/// standard libraries without the P0608 converting-constructor fix.
inline ParamValue text_value(const char* text) { return ParamValue{ std::string(text) }; }

struct GrievanceFacts {
    std::string id;
    std::string type;           // "ATTENDANCE_SHORTAGE", "FEE_WAIVER", ...
    Parameters  parameters;
};

/// Looks up a parameter; absent keys yield an empty optional.
std::optional<ParamValue> find_param(const Parameters& params, const std::string& key);

/// Renders a value for traces: numbers without trailing zeros, bools as true/false.
std::string to_string(const ParamValue& v);

// ── Dates ─────────────────────────────────────────────────────────────────────

struct Date {
    int year  = 0;
    int month = 0;
    int day   = 0;
};

inline bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const Date& a, const Date& b) { return !(a == b); }
inline bool operator<(const Date& a, const Date& b) {
    if (a.year != b.year)   return a.year < b.year;
    if (a.month != b.month) return a.month < b.month;
    return a.day < b.day;
}
inline bool operator>(const Date& a, const Date& b) { return b < a; }

/// Parses "YYYY-MM-DD". Returns nullopt on malformed or out-of-range input.
std::optional<Date> parse_date(const std::string& text);
std::string to_string(const Date& d);

// ── Enum text ─────────────────────────────────────────────────────────────────

std::string to_string(AuthorityTier t);   // "L1_National", ...
std::string to_string(Outcome o);         // "ACCEPT", ...

// Throw std::invalid_argument on unknown text.
AuthorityTier parse_tier(const std::string& text);
Outcome       parse_outcome(const std::string& text);

inline std::ostream& operator<<(std::ostream& os, AuthorityTier t) { return os << to_string(t); }
inline std::ostream& operator<<(std::ostream& os, Outcome o)       { return os << to_string(o); }
inline std::ostream& operator<<(std::ostream& os, const Date& d)   { return os << to_string(d); }

} // namespace grievance
