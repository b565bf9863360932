#pragma once

#include "AG/AST.hpp"
#include "AG/Runtime/Activation.hpp"
#include "AG/Runtime/FunctionRegistry.hpp"

#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ag {

// A fact asserted into every new session before any observation
struct InitialFact {
    std::string kind;
    Attributes attributes;
};

/**
 * @brief Immutable, validated collection of rules
 *
 * Loaded once and shared read-only (through std::shared_ptr<const
 * RuleLibrary>) by every session. Loading either yields a complete library
 * or throws; there is no partially-loaded state.
 */
class RuleLibrary {
public:
    /**
     * @brief Build a library from parsed statements
     * @param program Rules, output declarations and initial facts
     * @param functions Builtins that test guards and actions may call
     * @throws RuleLibraryError on duplicate rule names or malformed rules
     */
    static std::shared_ptr<const RuleLibrary> load(const Program& program,
                                                   FunctionRegistry functions = FunctionRegistry::builtins());

    /**
     * @brief Parse and load knowledge-base text
     * @throws ParseError, RuleLibraryError
     */
    static std::shared_ptr<const RuleLibrary> fromSource(std::string_view source);

    /**
     * @brief Parse and load a knowledge-base file
     * @throws ParseError, RuleLibraryError
     */
    static std::shared_ptr<const RuleLibrary> fromFile(const std::string& path);

    // Rules in declaration order
    const std::vector<Rule>& rules() const { return rules_; }

    // nullptr if no rule has that name
    const Rule* find(const std::string& name) const;

    bool isOutputKind(const std::string& kind) const { return outputSet_.count(kind) != 0; }

    // Output kinds in declaration order
    const std::vector<std::string>& outputKinds() const { return outputKinds_; }

    const std::vector<InitialFact>& initialFacts() const { return initialFacts_; }

    const FunctionRegistry& functions() const { return functions_; }

private:
    RuleLibrary() = default;

    std::vector<Rule> rules_;
    std::unordered_map<std::string, size_t> byName_;
    std::vector<std::string> outputKinds_;
    std::set<std::string> outputSet_;
    std::vector<InitialFact> initialFacts_;
    FunctionRegistry functions_;
};

} // namespace ag
