#include "grievance/types.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace grievance {

// ── Parameters ────────────────────────────────────────────────────────────────

std::optional<ParamValue> find_param(const Parameters& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end()) return std::nullopt;
    return it->second;
}

std::string to_string(const ParamValue& v) {
    if (const auto* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if (const auto* s = std::get_if<std::string>(&v)) return *s;

    std::ostringstream os;
    os << std::setprecision(15) << std::get<double>(v);
    return os.str();
}

// ── Dates ─────────────────────────────────────────────────────────────────────

namespace {

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (month == 2 && is_leap(year)) return 29;
    return days[month - 1];
}

bool all_digits(const std::string& s, std::size_t pos, std::size_t len) {
    for (std::size_t i = pos; i < pos + len; ++i)
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    return true;
}

} // namespace

std::optional<Date> parse_date(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    if (!all_digits(text, 0, 4) || !all_digits(text, 5, 2) || !all_digits(text, 8, 2))
        return std::nullopt;

    Date d;
    d.year  = std::stoi(text.substr(0, 4));
    d.month = std::stoi(text.substr(5, 2));
    d.day   = std::stoi(text.substr(8, 2));

    if (d.month < 1 || d.month > 12) return std::nullopt;
    if (d.day < 1 || d.day > days_in_month(d.year, d.month)) return std::nullopt;
    return d;
}

std::string to_string(const Date& d) {
    std::ostringstream os;
    os << std::setfill('0') << std::setw(4) << d.year << '-'
       << std::setw(2) << d.month << '-'
       << std::setw(2) << d.day;
    return os.str();
}

// ── Enum text ─────────────────────────────────────────────────────────────────

std::string to_string(AuthorityTier t) {
    switch (t) {
        case AuthorityTier::L1_National:      return "L1_National";
        case AuthorityTier::L2_Accreditation: return "L2_Accreditation";
        case AuthorityTier::L3_University:    return "L3_University";
    }
    return "Unknown";
}

std::string to_string(Outcome o) {
    switch (o) {
        case Outcome::Accept:               return "ACCEPT";
        case Outcome::Reject:               return "REJECT";
        case Outcome::PartialAccept:        return "PARTIAL_ACCEPT";
        case Outcome::PendingClarification: return "PENDING_CLARIFICATION";
    }
    return "UNKNOWN";
}

AuthorityTier parse_tier(const std::string& text) {
    if (text == "L1_National"      || text == "L1") return AuthorityTier::L1_National;
    if (text == "L2_Accreditation" || text == "L2") return AuthorityTier::L2_Accreditation;
    if (text == "L3_University"    || text == "L3") return AuthorityTier::L3_University;
    throw std::invalid_argument("unknown authority tier '" + text +
        "', must be: L1_National, L2_Accreditation or L3_University");
}

Outcome parse_outcome(const std::string& text) {
    if (text == "ACCEPT")                return Outcome::Accept;
    if (text == "REJECT")                return Outcome::Reject;
    if (text == "PARTIAL_ACCEPT")        return Outcome::PartialAccept;
    if (text == "PENDING_CLARIFICATION") return Outcome::PendingClarification;
    throw std::invalid_argument("unknown outcome '" + text +
        "', must be: ACCEPT, REJECT, PARTIAL_ACCEPT or PENDING_CLARIFICATION");
}

} // namespace grievance
