#include "AG/core.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace ag {

static std::string numberToString(double d) {
    std::ostringstream oss;
    if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e15) {
        oss << static_cast<long long>(d);
    } else {
        oss << d;
    }
    return oss.str();
}

static std::string quote(const std::string& s) {
    std::string res = "\"";
    for (char c : s) {
        switch (c) {
            case '"': res += "\\\""; break;
            case '\\': res += "\\\\"; break;
            case '\n': res += "\\n"; break;
            case '\t': res += "\\t"; break;
            default: res.push_back(c); break;
        }
    }
    res.push_back('"');
    return res;
}

std::string Value::toString() const {
    if (isBool()) return asBool() ? "true" : "false";
    if (isNumber()) return numberToString(asNumber());
    return asString();
}

std::string Value::toLiteral() const {
    if (isString()) return quote(asString());
    return toString();
}

std::string Value::key() const {
    if (isBool()) return asBool() ? "b:1" : "b:0";
    if (isNumber()) {
        // -0.0 == 0.0, so both share a key
        const double d = asNumber() == 0.0 ? 0.0 : asNumber();
        // 17 significant digits round-trip every double exactly
        std::ostringstream oss;
        oss << "n:" << std::setprecision(17) << d;
        return oss.str();
    }
    return "s:" + asString();
}

static void appendKeyPart(std::string& key, const std::string& part) {
    key += std::to_string(part.size());
    key.push_back(':');
    key += part;
}

std::string factKey(const std::string& kind, const Attributes& attributes) {
    // Every component is length-prefixed, so no string content can make two
    // distinct facts collide
    std::string key;
    appendKeyPart(key, kind);
    for (const auto& [name, value] : attributes) {
        appendKeyPart(key, name);
        appendKeyPart(key, value.key());
    }
    return key;
}

bool compareValues(CompareOp op, const Value& lhs, const Value& rhs) {
    if (op == CompareOp::Eq) return lhs == rhs;
    if (op == CompareOp::Ne) return lhs != rhs;

    if (lhs.isNumber() && rhs.isNumber()) {
        const double l = lhs.asNumber();
        const double r = rhs.asNumber();
        switch (op) {
            case CompareOp::Lt: return l < r;
            case CompareOp::Le: return l <= r;
            case CompareOp::Gt: return l > r;
            case CompareOp::Ge: return l >= r;
            default: return false;
        }
    }
    if (lhs.isString() && rhs.isString()) {
        const int c = lhs.asString().compare(rhs.asString());
        switch (op) {
            case CompareOp::Lt: return c < 0;
            case CompareOp::Le: return c <= 0;
            case CompareOp::Gt: return c > 0;
            case CompareOp::Ge: return c >= 0;
            default: return false;
        }
    }
    // Mixed types or booleans have no ordering
    return false;
}

const char* toString(CompareOp op) {
    switch (op) {
        case CompareOp::Eq: return "=";
        case CompareOp::Ne: return "!=";
        case CompareOp::Lt: return "<";
        case CompareOp::Le: return "<=";
        case CompareOp::Gt: return ">";
        case CompareOp::Ge: return ">=";
    }
    return "?";
}

std::string toString(const std::string& kind, const Attributes& attributes) {
    std::ostringstream oss;
    oss << kind << '(';
    bool first = true;
    for (const auto& [name, value] : attributes) {
        if (!first) oss << ", ";
        first = false;
        oss << name << '=' << value.toLiteral();
    }
    oss << ')';
    return oss.str();
}

std::string toString(const Fact& fact) {
    return toString(fact.kind, fact.attributes);
}

} // namespace ag
