#pragma once

#include "AG/core.hpp"

#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ag {

/**
 * @brief A builtin callable from test guards and action expressions
 *
 * `impl` returns std::nullopt when the arguments are unusable (wrong type,
 * out of range); the caller treats that as a failed evaluation.
 */
struct Function {
    std::string name;
    size_t minArgs{0};
    size_t maxArgs{0};
    std::function<std::optional<Value>(const std::vector<Value>&)> impl;

    static constexpr size_t kVariadic = std::numeric_limits<size_t>::max();
};

/**
 * @brief Registry of builtin functions, looked up by name
 *
 * Names are checked once when a rule library is loaded, so an unknown
 * function never reaches a running session.
 */
class FunctionRegistry {
public:
    /**
     * @brief Register a function (replaces any function of the same name)
     */
    void registerFunction(Function fn) {
        std::string name = fn.name;
        functions_[name] = std::move(fn);
    }

    // nullptr if no function has that name
    const Function* find(const std::string& name) const {
        auto it = functions_.find(name);
        return it == functions_.end() ? nullptr : &it->second;
    }

    size_t size() const { return functions_.size(); }

    /**
     * @brief Registry pre-populated with the standard builtins:
     * npk_level, fixed, concat, str, abs, min, max
     */
    static FunctionRegistry builtins();

private:
    std::map<std::string, Function> functions_;
};

// Qualitative lab level: "low" below 50 ppm, "medium" below 150, else "high"
std::string npkLevel(double ppm);

} // namespace ag
