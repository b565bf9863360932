#include "AG/Runtime/FunctionRegistry.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ag {

std::string npkLevel(double ppm) {
    if (ppm < 50) return "low";
    if (ppm < 150) return "medium";
    return "high";
}

FunctionRegistry FunctionRegistry::builtins() {
    FunctionRegistry reg;

    reg.registerFunction({"npk_level", 1, 1, [](const std::vector<Value>& args) -> std::optional<Value> {
        if (!args[0].isNumber()) return std::nullopt;
        return Value(npkLevel(args[0].asNumber()));
    }});

    // fixed(x, digits): number formatted with a fixed number of decimals
    reg.registerFunction({"fixed", 2, 2, [](const std::vector<Value>& args) -> std::optional<Value> {
        if (!args[0].isNumber() || !args[1].isNumber()) return std::nullopt;
        const double digits = args[1].asNumber();
        if (digits < 0 || digits > 17 || std::floor(digits) != digits) return std::nullopt;
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(static_cast<int>(digits)) << args[0].asNumber();
        return Value(oss.str());
    }});

    reg.registerFunction({"concat", 1, Function::kVariadic, [](const std::vector<Value>& args) -> std::optional<Value> {
        std::string s;
        for (const auto& a : args) s += a.toString();
        return Value(s);
    }});

    reg.registerFunction({"str", 1, 1, [](const std::vector<Value>& args) -> std::optional<Value> {
        return Value(args[0].toString());
    }});

    reg.registerFunction({"abs", 1, 1, [](const std::vector<Value>& args) -> std::optional<Value> {
        if (!args[0].isNumber()) return std::nullopt;
        return Value(std::fabs(args[0].asNumber()));
    }});

    reg.registerFunction({"min", 2, 2, [](const std::vector<Value>& args) -> std::optional<Value> {
        if (!args[0].isNumber() || !args[1].isNumber()) return std::nullopt;
        return Value(std::min(args[0].asNumber(), args[1].asNumber()));
    }});

    reg.registerFunction({"max", 2, 2, [](const std::vector<Value>& args) -> std::optional<Value> {
        if (!args[0].isNumber() || !args[1].isNumber()) return std::nullopt;
        return Value(std::max(args[0].asNumber(), args[1].asNumber()));
    }});

    return reg;
}

} // namespace ag
