#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace ag {

using FactId = std::uint64_t;

// Scalar attribute value: boolean, number or string. Enumerations such as
// growth stages are carried as strings.
class Value {
public:
    Value() : data_(false) {}
    Value(bool b) : data_(b) {}
    Value(int n) : data_(static_cast<double>(n)) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}

    bool isBool() const { return std::holds_alternative<bool>(data_); }
    bool isNumber() const { return std::holds_alternative<double>(data_); }
    bool isString() const { return std::holds_alternative<std::string>(data_); }

    bool asBool() const { return std::get<bool>(data_); }
    double asNumber() const { return std::get<double>(data_); }
    const std::string& asString() const { return std::get<std::string>(data_); }

    // Human readable form; strings are printed raw, numbers without a
    // trailing ".0" when integral.
    std::string toString() const;

    // Quoted form used when printing facts and rule text.
    std::string toLiteral() const;

    // Exact, type-tagged form used for fact deduplication keys.
    std::string key() const;

    friend bool operator==(const Value& a, const Value& b) { return a.data_ == b.data_; }
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    std::variant<bool, double, std::string> data_;
};

// Attributes are kept sorted by name so that identical facts compare and
// serialize identically regardless of the order they were written in.
using Attributes = std::map<std::string, Value>;

enum class CompareOp { Eq, Ne, Lt, Le, Gt, Ge };

// Equality across different types is false; ordering is only defined for
// number/number and string/string.
bool compareValues(CompareOp op, const Value& lhs, const Value& rhs);

const char* toString(CompareOp op);

struct Fact {
    FactId id{0};
    std::string kind;
    Attributes attributes;

    // nullptr when the attribute is absent
    const Value* find(const std::string& name) const {
        auto it = attributes.find(name);
        return it == attributes.end() ? nullptr : &it->second;
    }
};

// Identity of a (kind, attributes) pair: two facts share a key exactly
// when they are equal
std::string factKey(const std::string& kind, const Attributes& attributes);

// diagnosis(confidence=0.8, disease="Powdery Mildew")
std::string toString(const std::string& kind, const Attributes& attributes);
std::string toString(const Fact& fact);

} // namespace ag
