#include "grievance/rule.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace grievance {

// ── CompareOp ─────────────────────────────────────────────────────────────────

std::string to_string(CompareOp op) {
    switch (op) {
        case CompareOp::Eq:      return "==";
        case CompareOp::Ne:      return "!=";
        case CompareOp::Lt:      return "<";
        case CompareOp::Le:      return "<=";
        case CompareOp::Gt:      return ">";
        case CompareOp::Ge:      return ">=";
        case CompareOp::In:      return "in";
        case CompareOp::Exists:  return "exists";
        case CompareOp::IsTrue:  return "is_true";
        case CompareOp::IsFalse: return "is_false";
    }
    return "?";
}

CompareOp parse_op(const std::string& text) {
    if (text == "==")       return CompareOp::Eq;
    if (text == "!=")       return CompareOp::Ne;
    if (text == "<")        return CompareOp::Lt;
    if (text == "<=")       return CompareOp::Le;
    if (text == ">")        return CompareOp::Gt;
    if (text == ">=")       return CompareOp::Ge;
    if (text == "in")       return CompareOp::In;
    if (text == "exists")   return CompareOp::Exists;
    if (text == "is_true")  return CompareOp::IsTrue;
    if (text == "is_false") return CompareOp::IsFalse;
    throw std::invalid_argument("unknown operator '" + text +
        "', must be: ==, !=, <, <=, >, >=, in, exists, is_true or is_false");
}

std::string Condition::expression() const {
    switch (op) {
        case CompareOp::Exists:  return field + " exists";
        case CompareOp::IsTrue:  return field + " == true";
        case CompareOp::IsFalse: return field + " == false";
        case CompareOp::In: {
            std::string list;
            for (std::size_t i = 0; i < choices.size(); ++i) {
                if (i > 0) list += ", ";
                list += choices[i];
            }
            return field + " in [" + list + "]";
        }
        default:
            break;
    }
    std::string rhs = to_string(expected);
    if (std::holds_alternative<std::string>(expected)) rhs = "'" + rhs + "'";
    return field + " " + to_string(op) + " " + rhs;
}

// ── Templates ─────────────────────────────────────────────────────────────────

std::string render_template(const std::string& text, const Parameters& params) {
    std::string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        auto open = text.find('{', pos);
        if (open == std::string::npos) break;
        auto close = text.find('}', open + 1);
        if (close == std::string::npos) break;

        out.append(text, pos, open - pos);
        auto value = find_param(params, text.substr(open + 1, close - open - 1));
        if (value) {
            out += to_string(*value);
        } else {
            out.append(text, open, close - open + 1);
        }
        pos = close + 1;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

// ── RuleSet ───────────────────────────────────────────────────────────────────

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

void RuleSet::add(Rule rule) {
    if (rule.id.empty()) {
        throw std::invalid_argument("rule id must not be empty");
    }
    if (find(rule.id)) {
        throw std::invalid_argument("duplicate rule id '" + rule.id + "'");
    }
    rules_.push_back(std::move(rule));
}

const Rule* RuleSet::find(const std::string& id) const {
    for (const auto& r : rules_)
        if (r.id == id) return &r;
    return nullptr;
}

std::vector<const Rule*> RuleSet::by_tier(AuthorityTier tier) const {
    std::vector<const Rule*> out;
    for (const auto& r : rules_)
        if (r.tier == tier) out.push_back(&r);
    return out;
}

std::vector<const Rule*> RuleSet::by_category(const std::string& category) const {
    std::vector<const Rule*> out;
    for (const auto& r : rules_)
        if (iequals(r.provenance.category, category)) out.push_back(&r);
    return out;
}

std::vector<const Rule*> RuleSet::by_authority(const std::string& authority) const {
    std::vector<const Rule*> out;
    for (const auto& r : rules_)
        if (iequals(r.provenance.authority, authority)) out.push_back(&r);
    return out;
}

} // namespace grievance
